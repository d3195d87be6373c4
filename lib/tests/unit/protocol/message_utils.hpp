#pragma once

#include <cpp-zmq-plugin/protocol/envelope.hpp>
#include <cpp-zmq-plugin/protocol/header.hpp>
#include <cpp-zmq-plugin/protocol/schemas.hpp>

#include <leatherman/json_container/json_container.hpp>

#include <string>

namespace ZmqPlugin {

static const std::string REQUEST_MSG_ID { "f0e71a48-969c-4377-b953-35f0fc55c388" };
static const std::string REPLY_MSG_ID   { "0b6d0a2e-7d3f-4c1e-9b8a-2f5d3c6e1a47" };
static const std::string SESSION_ID     { "8e6b3f1c-24d7-4a59-a0c3-91f2e7d85b60" };
static const std::string DATE           { "2016-04-12T10:21:33.215Z" };

inline Header makeTestHeader(const std::string& msg_type,
                             const std::string& msg_id = REQUEST_MSG_ID,
                             const std::string& source = "clientA",
                             const std::string& target = "pluginB") {
    return Header { msg_id, SESSION_ID, DATE, source, target, msg_type,
                    Protocol::CURRENT_VERSION };
}

inline lth_jc::JsonContainer makeSocketsContent() {
    return lth_jc::JsonContainer {
        R"({"command":{"uri":"tcp://localhost","port":31337,"name":"spam"},)"
        R"("publish":{"uri":"tcp://localhost","port":31338}})" };
}

inline Envelope makeTestMessage(const std::string& msg_type,
                                const lth_jc::JsonContainer& content) {
    return Envelope { makeTestHeader(msg_type), content };
}

inline Envelope makeTestReply(const std::string& msg_type,
                              const std::string& request_type,
                              const lth_jc::JsonContainer& content) {
    return Envelope { makeTestHeader(msg_type, REPLY_MSG_ID, "pluginB", "clientA"),
                      makeTestHeader(request_type),
                      content };
}

}  // namespace ZmqPlugin
