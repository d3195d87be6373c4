#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_MESSAGE_BUILDER_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_MESSAGE_BUILDER_H_

#include <cpp-zmq-plugin/protocol/content_codec.hpp>
#include <cpp-zmq-plugin/protocol/envelope.hpp>
#include <cpp-zmq-plugin/protocol/header.hpp>
#include <cpp-zmq-plugin/protocol/schemas.hpp>
#include <cpp-zmq-plugin/export.h>

#include <leatherman/json_container/json_container.hpp>

#include <boost/optional.hpp>

#include <string>
#include <vector>

namespace ZmqPlugin {

//
// ErrorInfo
//

// Failure reported by an execute_reply
struct LIBCPP_ZMQ_PLUGIN_EXPORT ErrorInfo {
    std::string ename;
    std::string evalue;
    std::vector<std::string> traceback;

    ErrorInfo(std::string _ename,
              std::string _evalue = "",
              std::vector<std::string> _traceback = {});

    // "<ename>: <evalue>"; the form stamped in content.error
    std::string toString() const;

    lth_jc::JsonContainer toJson() const;
};

//
// MessageBuilderOptions
//

class LIBCPP_ZMQ_PLUGIN_EXPORT MessageBuilderOptions {
  public:
    // Protocol version stamped in the headers
    std::string version;

    // Format of the payloads, unless specified when building a message
    std::string mime_type;

    MessageBuilderOptions();

    MessageBuilderOptions(std::string _version,
                          std::string _mime_type);
};

//
// MessageBuilder
//

class LIBCPP_ZMQ_PLUGIN_EXPORT MessageBuilder {
  public:
    MessageBuilder();

    /// Throws a builder_config_error in case the version is not
    /// supported or the codec has no such format.
    explicit MessageBuilder(MessageBuilderOptions options);

    const MessageBuilderOptions& getOptions() const;

    /// Returns a header with new msg_id and date; a new session is
    /// generated in case none is specified.
    Header makeHeader(const std::string& source,
                      const std::string& target,
                      const std::string& msg_type,
                      const std::string& session = "") const;

    Envelope makeConnectRequest(const std::string& source,
                                const std::string& target) const;

    /// The content is expected to carry the 'command' and 'publish'
    /// socket entries; it is not checked here.
    Envelope makeConnectReply(const Envelope& request,
                              const lth_jc::JsonContainer& content) const;

    /// The payload format defaults to the one of the options.
    /// Throws an unsupported_format_error in case of unknown format.
    Envelope makeExecuteRequest(
        const std::string& source,
        const std::string& target,
        const std::string& command,
        const boost::optional<lth_jc::JsonContainer>& data = boost::none,
        const boost::optional<std::string>& mime_type = boost::none,
        bool silent = false,
        bool stop_on_error = false) const;

    /// Throws an invalid_reply_error in case the status is unknown,
    /// in case of "error" status with no error specified or in case
    /// the execution count exceeds INT_MAX.
    Envelope makeExecuteReply(
        const Envelope& request,
        unsigned int execution_count,
        const std::string& status = Protocol::STATUS_OK,
        const boost::optional<ErrorInfo>& error = boost::none,
        const boost::optional<lth_jc::JsonContainer>& data = boost::none,
        const boost::optional<std::string>& mime_type = boost::none) const;

  private:
    MessageBuilderOptions options_;

    // Swapped endpoints, same session
    Header makeReplyHeader(const Envelope& request,
                           const std::string& msg_type) const;

    lth_jc::JsonContainer encodeData(
        const boost::optional<lth_jc::JsonContainer>& data,
        const boost::optional<std::string>& mime_type) const;
};

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_MESSAGE_BUILDER_H_
