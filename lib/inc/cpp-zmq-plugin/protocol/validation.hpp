#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_VALIDATION_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_VALIDATION_H_

#include <cpp-zmq-plugin/protocol/envelope.hpp>
#include <cpp-zmq-plugin/validator/validator.hpp>
#include <cpp-zmq-plugin/export.h>

namespace ZmqPlugin {
namespace Protocol {

// Process-wide Validator holding the base message schema and the
// schemas of the default message types; compiled at the first call,
// read-only afterwards.
LIBCPP_ZMQ_PLUGIN_EXPORT const Validator& getMessageValidator();

// Validate the envelope against the base message schema and then
// against the schema of its msg_type; return the envelope unchanged.
//
// Throw a validation_error in case the envelope does not match the
// base message schema (the msg_type is not looked up in that case)
// or the schema of its type.
// Throw an unknown_message_type_error in case the msg_type has no
// registered schema.
LIBCPP_ZMQ_PLUGIN_EXPORT const Envelope& validate(const Envelope& envelope);

LIBCPP_ZMQ_PLUGIN_EXPORT const Envelope& validate(const Envelope& envelope,
                                                  const Validator& validator);

}  // namespace Protocol
}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_VALIDATION_H_
