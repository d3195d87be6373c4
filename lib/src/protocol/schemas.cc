#include <cpp-zmq-plugin/protocol/schemas.hpp>
#include <cpp-zmq-plugin/util/thread.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".schemas"
#include <leatherman/logging/logging.hpp>

#include <leatherman/locale/locale.hpp>

#include <algorithm>  // find

namespace ZmqPlugin {
namespace Protocol {

namespace lth_loc = leatherman::locale;

//
// envelope
//

static Schema NonEmptyString(std::string name) {
    Schema schema { std::move(name), TypeConstraint::String };
    schema.addMinLengthConstraint(1);
    return schema;
}

Schema HeaderSchema(const std::vector<std::string>& msg_types) {
    Schema msg_type { "msg_type", TypeConstraint::String };
    msg_type.addEnumConstraint(msg_types);

    Schema version { "version", TypeConstraint::String };
    version.addEnumConstraint(SUPPORTED_VERSIONS);

    Schema schema { HEADER_SCHEMA_NAME };
    schema.addConstraint("msg_id", NonEmptyString("msg_id"), true);
    schema.addConstraint("session", NonEmptyString("session"), true);
    schema.addConstraint("date", NonEmptyString("date"), true);
    schema.addConstraint("source", NonEmptyString("source"), true);
    schema.addConstraint("target", NonEmptyString("target"), true);
    schema.addConstraint("msg_type", msg_type, true);
    schema.addConstraint("version", version, true);
    return schema;
}

Schema BaseMessageSchema(const std::vector<std::string>& msg_types) {
    auto header = HeaderSchema(msg_types);

    Schema schema { BASE_MESSAGE_SCHEMA_NAME };
    schema.addConstraint("header", header, true);
    // in a chain of messages, the header of the parent is copied
    schema.addConstraint("parent_header", header, false);
    schema.addConstraint("metadata", TypeConstraint::Object, false);
    schema.addConstraint("content", TypeConstraint::Object, false);
    return schema;
}

Schema ErrorSchema() {
    Schema schema { ERROR_SCHEMA_NAME, TypeConstraint::Any };
    schema.addConstraint("ename", TypeConstraint::String, true);
    schema.addConstraint("evalue", TypeConstraint::String, false);

    Schema traceback { "traceback", TypeConstraint::Array };
    traceback.addItemsConstraint(Schema { "frame", TypeConstraint::String });
    schema.addConstraint("traceback", traceback, false);
    return schema;
}

//
// message types
//

Schema ConnectRequestSchema() {
    return Schema { CONNECT_REQUEST_TYPE };
}

Schema ConnectReplySchema() {
    Schema command { "command" };
    command.addConstraint("uri", TypeConstraint::String, true);
    command.addConstraint("port", TypeConstraint::Double, true);
    command.addConstraint("name", TypeConstraint::String, true);

    Schema publish { "publish" };
    publish.addConstraint("uri", TypeConstraint::String, true);
    publish.addConstraint("port", TypeConstraint::Double, true);

    Schema content { "content" };
    content.addConstraint("command", command, true);
    content.addConstraint("publish", publish, true);

    Schema schema { CONNECT_REPLY_TYPE };
    schema.addConstraint("content", content, true);
    schema.addRequired("parent_header");
    return schema;
}

Schema ExecuteRequestSchema() {
    Schema content { "content" };
    content.addConstraint("command", TypeConstraint::String, true);
    content.addConstraint("data", TypeConstraint::Any, false);
    content.addConstraint("metadata", TypeConstraint::Object, false);
    content.addConstraint("silent", TypeConstraint::Bool, false);
    content.addConstraint("stop_on_error", TypeConstraint::Bool, false);

    Schema schema { EXECUTE_REQUEST_TYPE };
    schema.addConstraint("content", content, false);
    return schema;
}

Schema ExecuteReplySchema() {
    Schema status { "status", TypeConstraint::String };
    status.addEnumConstraint(EXECUTE_STATUSES);

    Schema execution_count { "execution_count", TypeConstraint::Int };
    execution_count.addMinimumConstraint(0);

    Schema content { "content" };
    content.addConstraint("command", TypeConstraint::String, true);
    content.addConstraint("status", status, true);
    content.addConstraint("execution_count", execution_count, true);
    content.addConstraint("data", TypeConstraint::Any, false);
    content.addConstraint("metadata", TypeConstraint::Object, false);
    content.addConstraint("error", ErrorSchema(), false);

    Schema schema { EXECUTE_REPLY_TYPE };
    schema.addConstraint("content", content, true);
    schema.addRequired("parent_header");
    return schema;
}

std::vector<MessageTypeDefinition> DefaultMessageTypes() {
    return std::vector<MessageTypeDefinition> {
        { CONNECT_REQUEST_TYPE, ConnectRequestSchema },
        { CONNECT_REPLY_TYPE, ConnectReplySchema },
        { EXECUTE_REQUEST_TYPE, ExecuteRequestSchema },
        { EXECUTE_REPLY_TYPE, ExecuteReplySchema } };
}

//
// SchemaRegistry
//

SchemaRegistry::SchemaRegistry(std::vector<MessageTypeDefinition> definitions)
        : msg_types_ {},
          base_schema_ { nullptr },
          type_schemas_ {} {
    for (const auto& definition : definitions) {
        if (definition.msg_type == BASE_MESSAGE_SCHEMA_NAME
                || includesType(definition.msg_type)) {
            throw schema_redefinition_error {
                lth_loc::format("message type '{1}' already defined",
                                definition.msg_type) };
        }

        msg_types_.push_back(definition.msg_type);
    }

    base_schema_ = std::make_shared<Schema>(BaseMessageSchema(msg_types_));

    for (const auto& definition : definitions) {
        // base AND type constraints; the base schema is shared, not copied
        Schema schema { definition.msg_type };
        schema.addAllOf(base_schema_);
        schema.addAllOf(std::make_shared<Schema>(definition.constraints()));
        type_schemas_.insert(std::make_pair(definition.msg_type, schema));
    }

    LOG_DEBUG("Schema registry built with {1} message types", msg_types_.size());
}

SchemaRegistry::SchemaRegistry()
        : SchemaRegistry(DefaultMessageTypes()) {
}

Schema SchemaRegistry::getSchema(const std::string& type_tag) const {
    if (type_tag == BASE_MESSAGE_SCHEMA_NAME) {
        return *base_schema_;
    }

    auto schema_it = type_schemas_.find(type_tag);

    if (schema_it == type_schemas_.end()) {
        throw schema_not_found_error {
            lth_loc::format("unknown message type '{1}'", type_tag) };
    }

    return schema_it->second;
}

const std::vector<std::string>& SchemaRegistry::getMessageTypes() const {
    return msg_types_;
}

bool SchemaRegistry::includesType(const std::string& type_tag) const {
    return std::find(msg_types_.begin(), msg_types_.end(), type_tag)
           != msg_types_.end();
}

Validator SchemaRegistry::buildValidator() const {
    Validator validator {};
    validator.registerSchema(*base_schema_);

    for (const auto& msg_type : msg_types_) {
        validator.registerSchema(type_schemas_.at(msg_type));
    }

    return validator;
}

const SchemaRegistry& getSchemaRegistry() {
    static Util::once_flag init_flag;
    static std::unique_ptr<const SchemaRegistry> registry_ptr { nullptr };

    Util::call_once(init_flag, []() {
        registry_ptr.reset(new SchemaRegistry());
    });

    return *registry_ptr;
}

}  // namespace Protocol
}  // namespace ZmqPlugin
