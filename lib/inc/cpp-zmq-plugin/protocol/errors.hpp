#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_ERRORS_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_ERRORS_H_

#include <cpp-zmq-plugin/validator/validator.hpp>
#include <cpp-zmq-plugin/export.h>

#include <leatherman/json_container/json_container.hpp>

#include <stdexcept>
#include <string>

namespace ZmqPlugin {

/// Base error class.
class LIBCPP_ZMQ_PLUGIN_EXPORT message_error : public std::runtime_error {
  public:
    explicit message_error(std::string const& msg)
            : std::runtime_error(msg) {}
};

/// The envelope declares a msg_type that has no registered schema.
class LIBCPP_ZMQ_PLUGIN_EXPORT unknown_message_type_error : public validation_error {
  public:
    explicit unknown_message_type_error(std::string const& msg)
            : validation_error(msg) {}
};

/// The content of a received message reports a failure of the
/// remote side; the reported value is carried as is.
class LIBCPP_ZMQ_PLUGIN_EXPORT remote_error : public message_error {
  public:
    remote_error(std::string const& msg, lth_jc::JsonContainer error)
            : message_error(msg),
              error_ { std::move(error) } {}

    const lth_jc::JsonContainer& getError() const {
        return error_;
    }

  private:
    lth_jc::JsonContainer error_;
};

/// Unknown payload format (mime type)
class LIBCPP_ZMQ_PLUGIN_EXPORT unsupported_format_error : public message_error {
  public:
    explicit unsupported_format_error(std::string const& msg)
            : message_error(msg) {}
};

class LIBCPP_ZMQ_PLUGIN_EXPORT format_redefinition_error : public message_error {
  public:
    explicit format_redefinition_error(std::string const& msg)
            : message_error(msg) {}
};

/// The payload cannot be decoded with its declared format
class LIBCPP_ZMQ_PLUGIN_EXPORT data_decoding_error : public message_error {
  public:
    explicit data_decoding_error(std::string const& msg)
            : message_error(msg) {}
};

/// Inconsistent arguments for building a reply
class LIBCPP_ZMQ_PLUGIN_EXPORT invalid_reply_error : public message_error {
  public:
    explicit invalid_reply_error(std::string const& msg)
            : message_error(msg) {}
};

/// Invalid message builder options
class LIBCPP_ZMQ_PLUGIN_EXPORT builder_config_error : public message_error {
  public:
    explicit builder_config_error(std::string const& msg)
            : message_error(msg) {}
};

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_ERRORS_H_
