#include <cpp-zmq-plugin/protocol/message_builder.hpp>
#include <cpp-zmq-plugin/protocol/errors.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".message_builder"
#include <leatherman/logging/logging.hpp>

#include <leatherman/locale/locale.hpp>
#include <leatherman/util/time.hpp>
#include <leatherman/util/uuid.hpp>

#include <algorithm>
#include <limits>

namespace ZmqPlugin {

namespace lth_loc  = leatherman::locale;
namespace lth_util = leatherman::util;

//
// ErrorInfo
//

ErrorInfo::ErrorInfo(std::string _ename,
                     std::string _evalue,
                     std::vector<std::string> _traceback)
        : ename { std::move(_ename) },
          evalue { std::move(_evalue) },
          traceback { std::move(_traceback) } {
}

std::string ErrorInfo::toString() const {
    return ename + ": " + evalue;
}

lth_jc::JsonContainer ErrorInfo::toJson() const {
    lth_jc::JsonContainer error {};
    error.set<std::string>("ename", ename);
    error.set<std::string>("evalue", evalue);
    error.set<std::vector<std::string>>("traceback", traceback);
    return error;
}

//
// MessageBuilderOptions
//

MessageBuilderOptions::MessageBuilderOptions()
        : MessageBuilderOptions(Protocol::CURRENT_VERSION,
                                Protocol::DEFAULT_MIME_TYPE) {
}

MessageBuilderOptions::MessageBuilderOptions(std::string _version,
                                             std::string _mime_type)
        : version { std::move(_version) },
          mime_type { std::move(_mime_type) } {
}

//
// MessageBuilder
//

static bool contains(const std::vector<std::string>& values,
                     const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

MessageBuilder::MessageBuilder()
        : MessageBuilder(MessageBuilderOptions {}) {
}

MessageBuilder::MessageBuilder(MessageBuilderOptions options)
        : options_ { std::move(options) } {
    if (!contains(Protocol::SUPPORTED_VERSIONS, options_.version)) {
        throw builder_config_error {
            lth_loc::format("unsupported protocol version '{1}'",
                            options_.version) };
    }

    if (options_.mime_type != Protocol::NO_MIME_TYPE
            && !Protocol::getContentCodec().supportsFormat(options_.mime_type)) {
        throw builder_config_error {
            lth_loc::format("unsupported payload format '{1}'",
                            options_.mime_type) };
    }
}

const MessageBuilderOptions& MessageBuilder::getOptions() const {
    return options_;
}

Header MessageBuilder::makeHeader(const std::string& source,
                                  const std::string& target,
                                  const std::string& msg_type,
                                  const std::string& session) const {
    auto msg_id = lth_util::get_UUID();
    LOG_TRACE("Creating {1} header with id {2} ({3} -> {4})",
              msg_type, msg_id, source, target);

    return Header { msg_id,
                    (session.empty() ? lth_util::get_UUID() : session),
                    lth_util::get_ISO8601_time(),
                    source,
                    target,
                    msg_type,
                    options_.version };
}

Envelope MessageBuilder::makeConnectRequest(const std::string& source,
                                            const std::string& target) const {
    auto header = makeHeader(source, target, Protocol::CONNECT_REQUEST_TYPE);
    lth_jc::JsonContainer envelope {};
    envelope.set<lth_jc::JsonContainer>("header", header.toJson());

    return Envelope { envelope };
}

Envelope MessageBuilder::makeConnectReply(const Envelope& request,
                                          const lth_jc::JsonContainer& content) const {
    return Envelope { makeReplyHeader(request, Protocol::CONNECT_REPLY_TYPE),
                      request.getHeader(),
                      content };
}

Envelope MessageBuilder::makeExecuteRequest(
        const std::string& source,
        const std::string& target,
        const std::string& command,
        const boost::optional<lth_jc::JsonContainer>& data,
        const boost::optional<std::string>& mime_type,
        bool silent,
        bool stop_on_error) const {
    auto content = encodeData(data, mime_type);
    content.set<std::string>("command", command);
    content.set<bool>("silent", silent);
    content.set<bool>("stop_on_error", stop_on_error);

    auto header = makeHeader(source, target, Protocol::EXECUTE_REQUEST_TYPE);
    LOG_DEBUG("Created execute_request {1} for command '{2}'",
              header.msg_id, command);

    return Envelope { header, content };
}

Envelope MessageBuilder::makeExecuteReply(
        const Envelope& request,
        unsigned int execution_count,
        const std::string& status,
        const boost::optional<ErrorInfo>& error,
        const boost::optional<lth_jc::JsonContainer>& data,
        const boost::optional<std::string>& mime_type) const {
    if (!contains(Protocol::EXECUTE_STATUSES, status)) {
        throw invalid_reply_error {
            lth_loc::format("unknown execute_reply status '{1}'", status) };
    }

    if (status == Protocol::STATUS_ERROR && !error) {
        throw invalid_reply_error {
            lth_loc::translate("an error must be specified in case of "
                               "'error' status") };
    }

    if (execution_count > static_cast<unsigned int>(std::numeric_limits<int>::max())) {
        throw invalid_reply_error {
            lth_loc::format("execution count {1} out of range", execution_count) };
    }

    auto request_content = request.getContent();

    if (!request_content.includes("command")
            || request_content.type("command") != lth_jc::DataType::String) {
        throw invalid_reply_error {
            lth_loc::translate("the request does not specify a command") };
    }

    auto content = encodeData(data, mime_type);
    content.set<std::string>("command",
                             request_content.get<std::string>("command"));
    content.set<std::string>("status", status);
    content.set<int>("execution_count", static_cast<int>(execution_count));

    if (error) {
        content.set<std::string>("error", error->toString());
    }

    auto header = makeReplyHeader(request, Protocol::EXECUTE_REPLY_TYPE);
    LOG_DEBUG("Created execute_reply {1} to {2} with status '{3}'",
              header.msg_id, request.getHeader().msg_id, status);

    return Envelope { header, request.getHeader(), content };
}

// Private

Header MessageBuilder::makeReplyHeader(const Envelope& request,
                                       const std::string& msg_type) const {
    auto request_header = request.getHeader();

    return makeHeader(request_header.target,
                      request_header.source,
                      msg_type,
                      request_header.session);
}

lth_jc::JsonContainer MessageBuilder::encodeData(
        const boost::optional<lth_jc::JsonContainer>& data,
        const boost::optional<std::string>& mime_type) const {
    return Protocol::encodeContent(data,
                                   (mime_type ? *mime_type : options_.mime_type));
}

}  // namespace ZmqPlugin
