#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_HEADER_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_HEADER_H_

#include <cpp-zmq-plugin/export.h>

#include <leatherman/json_container/json_container.hpp>

#include <string>

namespace ZmqPlugin {

namespace lth_jc = leatherman::json_container;

//
// Header
//

struct LIBCPP_ZMQ_PLUGIN_EXPORT Header {
    std::string msg_id;
    std::string session;
    std::string date;
    std::string source;
    std::string target;
    std::string msg_type;
    std::string version;

    Header(std::string _msg_id,
           std::string _session,
           std::string _date,
           std::string _source,
           std::string _target,
           std::string _msg_type,
           std::string _version);

    // Throw a message_error in case any of the header entries is
    // missing or is not a string.
    explicit Header(const lth_jc::JsonContainer& json_header);

    lth_jc::JsonContainer toJson() const;

    std::string toString() const;
};

LIBCPP_ZMQ_PLUGIN_EXPORT bool operator==(const Header& lhs, const Header& rhs);
LIBCPP_ZMQ_PLUGIN_EXPORT bool operator!=(const Header& lhs, const Header& rhs);

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_HEADER_H_
