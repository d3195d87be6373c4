#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_SERIALIZATION_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_SERIALIZATION_H_

#include <cpp-zmq-plugin/export.h>

#include <leatherman/json_container/json_container.hpp>

#include <string>

/* Text serializations of payload values. A payload is any JSON value
   (object, array, scalar or null) held by a JsonContainer.

   The deserialize functions throw a data_decoding_error in case of
   malformed input.
*/

namespace ZmqPlugin {

namespace lth_jc = leatherman::json_container;

// Native object format: Boost.Serialization text archive of the
// value tree; numbers keep their integer/floating point kind.
LIBCPP_ZMQ_PLUGIN_EXPORT std::string serializeNative(const lth_jc::JsonContainer& value);
LIBCPP_ZMQ_PLUGIN_EXPORT lth_jc::JsonContainer deserializeNative(const std::string& archive_txt);

// YAML document; strings are always quoted, so that they are read
// back as strings.
LIBCPP_ZMQ_PLUGIN_EXPORT std::string serializeYaml(const lth_jc::JsonContainer& value);
LIBCPP_ZMQ_PLUGIN_EXPORT lth_jc::JsonContainer deserializeYaml(const std::string& yaml_txt);

// JSON text
LIBCPP_ZMQ_PLUGIN_EXPORT std::string serializeJson(const lth_jc::JsonContainer& value);
LIBCPP_ZMQ_PLUGIN_EXPORT lth_jc::JsonContainer deserializeJson(const std::string& json_txt);

// Wrap a string into a JSON string value and back; getStringValue
// throws a data_decoding_error in case the value is not a string.
LIBCPP_ZMQ_PLUGIN_EXPORT lth_jc::JsonContainer makeStringValue(const std::string& txt);
LIBCPP_ZMQ_PLUGIN_EXPORT std::string getStringValue(const lth_jc::JsonContainer& value);

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_SERIALIZATION_H_
