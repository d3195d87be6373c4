#ifndef CPP_ZMQ_PLUGIN_SRC_PROTOCOL_SCHEMAS_H_
#define CPP_ZMQ_PLUGIN_SRC_PROTOCOL_SCHEMAS_H_

#include <cpp-zmq-plugin/validator/schema.hpp>
#include <cpp-zmq-plugin/validator/validator.hpp>
#include <cpp-zmq-plugin/export.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ZmqPlugin {
namespace Protocol {

//
// versions
//

// Ordered list of supported protocol versions; the last entry should
// be used when creating new messages
static const std::vector<std::string> SUPPORTED_VERSIONS { "0.2", "0.3" };
static const std::string CURRENT_VERSION { "0.3" };

//
// envelope
//

static const std::string HEADER_SCHEMA_NAME { "header" };
LIBCPP_ZMQ_PLUGIN_EXPORT Schema HeaderSchema(const std::vector<std::string>& msg_types);

static const std::string BASE_MESSAGE_SCHEMA_NAME { "base_message" };
LIBCPP_ZMQ_PLUGIN_EXPORT Schema BaseMessageSchema(const std::vector<std::string>& msg_types);

// NB: the error schema constrains object values only; the textual
// form of an error is accepted as well
static const std::string ERROR_SCHEMA_NAME { "error" };
LIBCPP_ZMQ_PLUGIN_EXPORT Schema ErrorSchema();

//
// message types
//
// The following schemas carry only the type-specific constraints;
// SchemaRegistry composes each of them with the base message schema.

// connect
static const std::string CONNECT_REQUEST_TYPE { "connect_request" };
static const std::string CONNECT_REPLY_TYPE   { "connect_reply" };
LIBCPP_ZMQ_PLUGIN_EXPORT Schema ConnectRequestSchema();
LIBCPP_ZMQ_PLUGIN_EXPORT Schema ConnectReplySchema();

// execute
static const std::string EXECUTE_REQUEST_TYPE { "execute_request" };
static const std::string EXECUTE_REPLY_TYPE   { "execute_reply" };
LIBCPP_ZMQ_PLUGIN_EXPORT Schema ExecuteRequestSchema();
LIBCPP_ZMQ_PLUGIN_EXPORT Schema ExecuteReplySchema();

// execute_reply status values
static const std::string STATUS_OK    { "ok" };
static const std::string STATUS_ERROR { "error" };
static const std::string STATUS_ABORT { "abort" };
static const std::vector<std::string> EXECUTE_STATUSES { STATUS_OK,
                                                         STATUS_ERROR,
                                                         STATUS_ABORT };

//
// SchemaRegistry
//

struct LIBCPP_ZMQ_PLUGIN_EXPORT MessageTypeDefinition {
    std::string msg_type;
    std::function<Schema()> constraints;
};

// The four protocol message types
LIBCPP_ZMQ_PLUGIN_EXPORT std::vector<MessageTypeDefinition> DefaultMessageTypes();

class LIBCPP_ZMQ_PLUGIN_EXPORT SchemaRegistry {
  public:
    // Build the base message schema, with the header msg_type
    // restricted to the defined types, and one schema per type.
    // Throw a schema_redefinition_error in case a type is defined
    // twice or is named after the base message schema.
    explicit SchemaRegistry(std::vector<MessageTypeDefinition> definitions);

    SchemaRegistry();

    // Return the schema of the specified message type; the base
    // message schema is returned for BASE_MESSAGE_SCHEMA_NAME.
    // Throw a schema_not_found_error in case of unknown type.
    Schema getSchema(const std::string& type_tag) const;

    // Recognized msg_type tags, in definition order
    const std::vector<std::string>& getMessageTypes() const;

    bool includesType(const std::string& type_tag) const;

    // Return a Validator with the base message schema and the schemas
    // of all types registered.
    Validator buildValidator() const;

  private:
    std::vector<std::string> msg_types_;
    std::shared_ptr<const Schema> base_schema_;
    std::map<std::string, Schema> type_schemas_;
};

// Process-wide registry of the default message types; built at the
// first call, read-only afterwards.
LIBCPP_ZMQ_PLUGIN_EXPORT const SchemaRegistry& getSchemaRegistry();

}  // namespace Protocol
}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_PROTOCOL_SCHEMAS_H_
