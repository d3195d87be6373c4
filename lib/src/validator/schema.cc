#include <cpp-zmq-plugin/validator/schema.hpp>

#include <leatherman/locale/locale.hpp>

namespace ZmqPlugin {

namespace lth_loc = leatherman::locale;

//
// Auxiliary functions
//

// Convert ZmqPlugin::TypeConstraint to the JSON schema type names
static std::string getTypeName(TypeConstraint type) {
    switch (type) {
        case TypeConstraint::Object :
            return "object";
        case TypeConstraint::Array :
            return "array";
        case TypeConstraint::String :
            return "string";
        case TypeConstraint::Int :
            return "integer";
        case TypeConstraint::Bool :
            return "boolean";
        case TypeConstraint::Double :
            return "number";
        case TypeConstraint::Null :
            return "null";
        default:
            return "";
    }
}

//
// Public API
//

Schema::Schema(std::string name, TypeConstraint type)
        : name_ { std::move(name) },
          type_ { type },
          parsed_ { false },
          parsed_json_schema_ {},
          properties_ {},
          required_properties_ {},
          enum_values_ {},
          min_length_ { -1 },
          has_minimum_ { false },
          minimum_ { 0 },
          items_ { nullptr },
          all_of_ {} {
}

Schema::Schema(std::string name)
        : Schema(std::move(name), TypeConstraint::Object) {
}

Schema::Schema(std::string name, const lth_jc::JsonContainer& json_schema)
        : Schema(std::move(name), TypeConstraint::Any) {
    if (json_schema.type() != lth_jc::DataType::Object) {
        throw schema_error {
            lth_loc::format("failed to parse schema '{1}': the schema "
                            "document must be a JSON object", name_) };
    }

    parsed_json_schema_ = json_schema;
    parsed_ = true;
}

void Schema::addConstraint(std::string field, TypeConstraint type, bool required) {
    checkAddPropertyConstraint();
    properties_[field] = std::make_shared<Schema>(field, type);

    if (required) {
        required_properties_.insert(field);
    }
}

void Schema::addConstraint(std::string field, Schema sub_schema, bool required) {
    checkAddPropertyConstraint();
    properties_[field] = std::make_shared<Schema>(std::move(sub_schema));

    if (required) {
        required_properties_.insert(field);
    }
}

void Schema::addRequired(std::string field) {
    checkAddPropertyConstraint();
    required_properties_.insert(std::move(field));
}

void Schema::addEnumConstraint(std::vector<std::string> values) {
    checkAddConstraint();

    if (values.empty()) {
        throw schema_error {
            lth_loc::format("schema '{1}': an enum constraint requires at "
                            "least one value", name_) };
    }

    enum_values_ = std::move(values);
}

void Schema::addMinLengthConstraint(unsigned int min_length) {
    checkAddConstraint();

    if (type_ != TypeConstraint::String) {
        throw schema_error {
            lth_loc::format("schema '{1}': a length constraint applies only "
                            "to strings", name_) };
    }

    min_length_ = static_cast<int>(min_length);
}

void Schema::addMinimumConstraint(int minimum) {
    checkAddConstraint();

    if (type_ != TypeConstraint::Int && type_ != TypeConstraint::Double) {
        throw schema_error {
            lth_loc::format("schema '{1}': a minimum constraint applies only "
                            "to numbers", name_) };
    }

    has_minimum_ = true;
    minimum_ = minimum;
}

void Schema::addItemsConstraint(Schema item_schema) {
    checkAddConstraint();

    if (type_ != TypeConstraint::Array) {
        throw schema_error {
            lth_loc::format("schema '{1}': an items constraint applies only "
                            "to arrays", name_) };
    }

    items_ = std::make_shared<Schema>(std::move(item_schema));
}

void Schema::addAllOf(std::shared_ptr<const Schema> schema) {
    checkAddConstraint();

    if (schema == nullptr) {
        throw schema_error {
            lth_loc::format("schema '{1}': cannot compose a null schema", name_) };
    }

    all_of_.push_back(std::move(schema));
}

const std::string& Schema::getName() const {
    return name_;
}

TypeConstraint Schema::getType() const {
    return type_;
}

bool Schema::isParsed() const {
    return parsed_;
}

std::vector<std::string> Schema::getRequiredFields() const {
    return std::vector<std::string>(required_properties_.begin(),
                                    required_properties_.end());
}

lth_jc::JsonContainer Schema::getJsonSchema() const {
    if (parsed_) {
        return parsed_json_schema_;
    }

    lth_jc::JsonContainer json_schema {};
    json_schema.set<std::string>("title", name_);

    if (type_ != TypeConstraint::Any) {
        json_schema.set<std::string>("type", getTypeName(type_));
    }

    if (!properties_.empty()) {
        lth_jc::JsonContainer properties {};

        for (const auto& property : properties_) {
            properties.set<lth_jc::JsonContainer>(
                property.first, property.second->getJsonSchema());
        }

        json_schema.set<lth_jc::JsonContainer>("properties", properties);
    }

    if (!required_properties_.empty()) {
        json_schema.set<std::vector<std::string>>("required",
                                                  getRequiredFields());
    }

    if (!enum_values_.empty()) {
        json_schema.set<std::vector<std::string>>("enum", enum_values_);
    }

    if (min_length_ >= 0) {
        json_schema.set<int>("minLength", min_length_);
    }

    if (has_minimum_) {
        json_schema.set<int>("minimum", minimum_);
    }

    if (items_ != nullptr) {
        json_schema.set<lth_jc::JsonContainer>("items", items_->getJsonSchema());
    }

    if (!all_of_.empty()) {
        std::vector<lth_jc::JsonContainer> composed {};

        for (const auto& schema : all_of_) {
            composed.push_back(schema->getJsonSchema());
        }

        json_schema.set<std::vector<lth_jc::JsonContainer>>("allOf", composed);
    }

    return json_schema;
}

//
// Private methods
//

void Schema::checkAddConstraint() const {
    if (parsed_) {
        throw schema_error {
            lth_loc::translate("cannot add constraints to a schema that "
                               "was previously parsed") };
    }
}

void Schema::checkAddPropertyConstraint() const {
    checkAddConstraint();

    if (type_ != TypeConstraint::Object && type_ != TypeConstraint::Any) {
        throw schema_error {
            lth_loc::format("schema '{1}': only object schemas admit field "
                            "constraints", name_) };
    }
}

}  // namespace ZmqPlugin
