#include "tests/test.hpp"
#include "message_utils.hpp"

#include <cpp-zmq-plugin/protocol/message_builder.hpp>
#include <cpp-zmq-plugin/protocol/validation.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>

#include <limits>

namespace ZmqPlugin {

static const lth_jc::JsonContainer ARGS { "[1, 2]" };

TEST_CASE("MessageBuilder::MessageBuilder", "[builder]") {
    SECTION("uses the current version and the native format by default") {
        MessageBuilder builder {};
        REQUIRE(builder.getOptions().version == Protocol::CURRENT_VERSION);
        REQUIRE(builder.getOptions().mime_type == Protocol::NATIVE_MIME_TYPE);
    }

    SECTION("accepts all the supported versions") {
        for (const auto& version : Protocol::SUPPORTED_VERSIONS) {
            MessageBuilderOptions options { version, Protocol::YAML_MIME_TYPE };
            REQUIRE_NOTHROW(MessageBuilder { options });
        }
    }

    SECTION("accepts the no format value") {
        MessageBuilderOptions options { Protocol::CURRENT_VERSION,
                                        Protocol::NO_MIME_TYPE };
        REQUIRE_NOTHROW(MessageBuilder { options });
    }

    SECTION("throws a builder_config_error in case of unsupported version") {
        MessageBuilderOptions options { "0.1", Protocol::NATIVE_MIME_TYPE };
        REQUIRE_THROWS_AS(MessageBuilder { options }, builder_config_error);
    }

    SECTION("throws a builder_config_error in case of unknown format") {
        MessageBuilderOptions options { Protocol::CURRENT_VERSION,
                                        "application/x-unknown" };
        REQUIRE_THROWS_AS(MessageBuilder { options }, builder_config_error);
    }
}

TEST_CASE("MessageBuilder::makeHeader", "[builder]") {
    MessageBuilder builder { MessageBuilderOptions { "0.2",
                                                     Protocol::NATIVE_MIME_TYPE } };

    SECTION("fills all the fields") {
        auto header = builder.makeHeader("clientA", "pluginB",
                                         Protocol::EXECUTE_REQUEST_TYPE);

        REQUIRE_FALSE(header.msg_id.empty());
        REQUIRE_FALSE(header.session.empty());
        REQUIRE_FALSE(header.date.empty());
        REQUIRE(header.source == "clientA");
        REQUIRE(header.target == "pluginB");
        REQUIRE(header.msg_type == Protocol::EXECUTE_REQUEST_TYPE);
        REQUIRE(header.version == "0.2");
    }

    SECTION("generates a new msg_id and session each time") {
        auto first = builder.makeHeader("clientA", "pluginB",
                                        Protocol::EXECUTE_REQUEST_TYPE);
        auto second = builder.makeHeader("clientA", "pluginB",
                                         Protocol::EXECUTE_REQUEST_TYPE);

        REQUIRE(first.msg_id != second.msg_id);
        REQUIRE(first.session != second.session);
    }

    SECTION("keeps the specified session") {
        auto header = builder.makeHeader("clientA", "pluginB",
                                         Protocol::EXECUTE_REQUEST_TYPE,
                                         SESSION_ID);
        REQUIRE(header.session == SESSION_ID);
    }
}

TEST_CASE("MessageBuilder::makeConnectRequest", "[builder]") {
    MessageBuilder builder {};
    auto request = builder.makeConnectRequest("clientA", "pluginB");

    SECTION("creates a valid connect_request with no content") {
        REQUIRE(request.getMessageType() == Protocol::CONNECT_REQUEST_TYPE);
        REQUIRE_FALSE(request.hasContent());
        REQUIRE_NOTHROW(Protocol::validate(request));
    }
}

TEST_CASE("MessageBuilder::makeConnectReply", "[builder]") {
    MessageBuilder builder {};
    auto request = builder.makeConnectRequest("clientA", "pluginB");

    SECTION("creates a valid connect_reply") {
        auto reply = builder.makeConnectReply(request, makeSocketsContent());

        REQUIRE(reply.getMessageType() == Protocol::CONNECT_REPLY_TYPE);
        REQUIRE(reply.getContent().toString() == makeSocketsContent().toString());
        REQUIRE_NOTHROW(Protocol::validate(reply));
    }

    SECTION("swaps the endpoints and keeps the session") {
        auto reply = builder.makeConnectReply(request, makeSocketsContent());
        auto header = reply.getHeader();

        REQUIRE(header.source == "pluginB");
        REQUIRE(header.target == "clientA");
        REQUIRE(header.session == request.getHeader().session);
        REQUIRE(header.msg_id != request.getHeader().msg_id);
        REQUIRE(reply.getParentHeader() == request.getHeader());
    }

    SECTION("a connect_reply with no publish socket does not validate") {
        lth_jc::JsonContainer content {};
        content.set<lth_jc::JsonContainer>(
            "command", makeSocketsContent().get<lth_jc::JsonContainer>("command"));
        auto reply = builder.makeConnectReply(request, content);

        REQUIRE_THROWS_AS(Protocol::validate(reply), validation_error);
    }
}

TEST_CASE("MessageBuilder::makeExecuteRequest", "[builder]") {
    MessageBuilder builder {};

    SECTION("creates a valid execute_request") {
        auto request = builder.makeExecuteRequest("clientA", "pluginB", "add", ARGS);
        auto content = request.getContent();

        REQUIRE(request.getMessageType() == Protocol::EXECUTE_REQUEST_TYPE);
        REQUIRE(content.get<std::string>("command") == "add");
        REQUIRE_FALSE(content.get<bool>("silent"));
        REQUIRE_FALSE(content.get<bool>("stop_on_error"));
        REQUIRE(content.get<std::string>({ "metadata", "mime_type" })
                == Protocol::NATIVE_MIME_TYPE);
        REQUIRE_NOTHROW(Protocol::validate(request));
    }

    SECTION("the payload can be decoded") {
        auto request = builder.makeExecuteRequest("clientA", "pluginB", "add", ARGS);
        auto data = Protocol::decodeMessageData(request);

        REQUIRE(data.is_initialized());
        REQUIRE(data->toString() == ARGS.toString());
    }

    SECTION("no payload entries in case of no data") {
        auto request = builder.makeExecuteRequest("clientA", "pluginB", "ping");
        auto content = request.getContent();

        REQUIRE_FALSE(content.includes("data"));
        REQUIRE_FALSE(content.includes("metadata"));
        REQUIRE_FALSE(Protocol::decodeMessageData(request).is_initialized());
    }

    SECTION("uses the specified format and flags") {
        auto request = builder.makeExecuteRequest("clientA", "pluginB", "add", ARGS,
                                                  Protocol::YAML_MIME_TYPE,
                                                  true, true);
        auto content = request.getContent();

        REQUIRE(content.get<std::string>({ "metadata", "mime_type" })
                == Protocol::YAML_MIME_TYPE);
        REQUIRE(content.get<bool>("silent"));
        REQUIRE(content.get<bool>("stop_on_error"));
        REQUIRE(Protocol::decodeMessageData(request)->toString() == ARGS.toString());
    }

    SECTION("uses the format of the options") {
        MessageBuilder json_builder { MessageBuilderOptions {
            Protocol::CURRENT_VERSION, Protocol::JSON_MIME_TYPE } };
        auto request = json_builder.makeExecuteRequest("clientA", "pluginB",
                                                       "add", ARGS);

        REQUIRE(request.getContent().get<std::string>({ "metadata", "mime_type" })
                == Protocol::JSON_MIME_TYPE);
    }

    SECTION("throws an unsupported_format_error in case of unknown format") {
        REQUIRE_THROWS_AS(
            builder.makeExecuteRequest("clientA", "pluginB", "add", ARGS,
                                       std::string { "application/x-unknown" }),
            unsupported_format_error);
    }
}

TEST_CASE("MessageBuilder::makeExecuteReply", "[builder]") {
    MessageBuilder builder {};
    auto request = builder.makeExecuteRequest("clientA", "pluginB", "add", ARGS);

    SECTION("creates a valid execute_reply") {
        auto reply = builder.makeExecuteReply(request, 1);
        auto content = reply.getContent();

        REQUIRE(reply.getMessageType() == Protocol::EXECUTE_REPLY_TYPE);
        REQUIRE(content.get<std::string>("command") == "add");
        REQUIRE(content.get<std::string>("status") == Protocol::STATUS_OK);
        REQUIRE(content.get<int>("execution_count") == 1);
        REQUIRE_FALSE(content.includes("error"));
        REQUIRE_NOTHROW(Protocol::validate(reply));
    }

    SECTION("keeps the session and stores the request header") {
        auto reply = builder.makeExecuteReply(request, 1);

        REQUIRE(reply.getHeader().session == request.getHeader().session);
        REQUIRE(reply.getParentHeader() == request.getHeader());
        REQUIRE(reply.getHeader().source == "pluginB");
        REQUIRE(reply.getHeader().target == "clientA");
    }

    SECTION("the result can be decoded") {
        lth_jc::JsonContainer result { "3" };
        auto reply = builder.makeExecuteReply(request, 1, Protocol::STATUS_OK,
                                              boost::none, result);

        REQUIRE(Protocol::decodeMessageData(reply)->toString() == "3");
    }

    SECTION("throws an invalid_reply_error in case of error status and no error") {
        REQUIRE_THROWS_AS(builder.makeExecuteReply(request, 1, Protocol::STATUS_ERROR),
                          invalid_reply_error);
    }

    SECTION("stamps the error in case of error status") {
        ErrorInfo error { "ZeroDivisionError", "division by zero" };
        auto reply = builder.makeExecuteReply(request, 1, Protocol::STATUS_ERROR,
                                              error);

        REQUIRE(reply.getContent().get<std::string>("error")
                == "ZeroDivisionError: division by zero");
        REQUIRE_NOTHROW(Protocol::validate(reply));
        REQUIRE_THROWS_AS(Protocol::decodeMessageData(reply), remote_error);
    }

    SECTION("stamps the error regardless of the status") {
        ErrorInfo error { "KeyboardInterrupt" };
        auto reply = builder.makeExecuteReply(request, 1, Protocol::STATUS_ABORT,
                                              error);

        REQUIRE(reply.getContent().get<std::string>("error")
                == "KeyboardInterrupt: ");
    }

    SECTION("throws an invalid_reply_error in case of unknown status") {
        REQUIRE_THROWS_AS(builder.makeExecuteReply(request, 1, "done"),
                          invalid_reply_error);
    }

    SECTION("accepts the largest execution count") {
        auto max_count = static_cast<unsigned int>(std::numeric_limits<int>::max());
        auto reply = builder.makeExecuteReply(request, max_count);

        REQUIRE(reply.getContent().get<int>("execution_count")
                == std::numeric_limits<int>::max());
        REQUIRE_NOTHROW(Protocol::validate(reply));
    }

    SECTION("throws an invalid_reply_error in case the execution count is too large") {
        auto count = static_cast<unsigned int>(std::numeric_limits<int>::max()) + 1u;
        REQUIRE_THROWS_AS(builder.makeExecuteReply(request, count),
                          invalid_reply_error);
        REQUIRE_THROWS_AS(builder.makeExecuteReply(request, 3000000000u),
                          invalid_reply_error);
    }

    SECTION("throws an invalid_reply_error in case the request has no command") {
        auto connect_request = builder.makeConnectRequest("clientA", "pluginB");
        REQUIRE_THROWS_AS(builder.makeExecuteReply(connect_request, 1),
                          invalid_reply_error);
    }
}

TEST_CASE("ErrorInfo", "[builder]") {
    ErrorInfo error { "ValueError", "bad value", { "frame 1", "frame 2" } };

    SECTION("textual form") {
        REQUIRE(error.toString() == "ValueError: bad value");
    }

    SECTION("JSON form") {
        auto json_error = error.toJson();
        REQUIRE(json_error.get<std::string>("ename") == "ValueError");
        REQUIRE(json_error.get<std::vector<std::string>>("traceback").size() == 2u);
    }
}

}  // namespace ZmqPlugin
