#ifndef CPP_ZMQ_PLUGIN_SRC_VALIDATOR_SCHEMA_H_
#define CPP_ZMQ_PLUGIN_SRC_VALIDATOR_SCHEMA_H_

#include <leatherman/json_container/json_container.hpp>
#include <cpp-zmq-plugin/export.h>

#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ZmqPlugin {

namespace lth_jc = leatherman::json_container;

enum class TypeConstraint { Object, Array, String, Int, Bool, Double, Null, Any };

class LIBCPP_ZMQ_PLUGIN_EXPORT schema_error : public std::runtime_error  {
  public:
    explicit schema_error(std::string const& msg)
            : std::runtime_error(msg) {}
};

class LIBCPP_ZMQ_PLUGIN_EXPORT Schema {
  public:
    Schema() = delete;

    // The following constructors instantiate an empty Schema with no
    // constraint other than the type one; the default type is Object

    Schema(std::string name, TypeConstraint type);

    explicit Schema(std::string name);

    // Instantiate a Schema by taking a JSON schema (draft 4) document
    // passed as a JsonContainer object.
    // It won't be possible to add further constraints to such schema.
    // Throw a schema_error in case the document is not a JSON object.
    Schema(std::string name, const lth_jc::JsonContainer& json_schema);

    // Add constraints to a JSON object schema.
    // Throw a schema_error in case the Schema instance is not of
    // TypeConstraint::Object or TypeConstraint::Any type or if it was
    // constructed from a JSON schema document. In an Any schema the
    // field constraints apply only when the value is an object.
    void addConstraint(std::string field, TypeConstraint type, bool required = false);
    void addConstraint(std::string field, Schema sub_schema, bool required = false);

    // Make the field mandatory without constraining its value.
    void addRequired(std::string field);

    // Restrict the admitted values to the specified ones.
    void addEnumConstraint(std::vector<std::string> values);

    // String schemas only.
    void addMinLengthConstraint(unsigned int min_length);

    // Int and Double schemas only.
    void addMinimumConstraint(int minimum);

    // Array schemas only; every item must satisfy the specified schema.
    void addItemsConstraint(Schema item_schema);

    // The value must satisfy the specified schema as well (logical
    // AND). The schema is held by reference; it is never modified.
    void addAllOf(std::shared_ptr<const Schema> schema);

    const std::string& getName() const;
    TypeConstraint getType() const;
    bool isParsed() const;

    // Names of the fields added with required = true
    std::vector<std::string> getRequiredFields() const;

    // Return the JSON schema (draft 4) document equivalent to all
    // the constraints, composed schemas included.
    lth_jc::JsonContainer getJsonSchema() const;

  private:
    std::string name_;

    // To add a global type constraint; default to Object (see ctors)
    TypeConstraint type_;

    // Flag; set in case the used ctor was the parsing one
    bool parsed_;

    // Stores the document passed to the parsing ctor
    lth_jc::JsonContainer parsed_json_schema_;

    // Constraints
    std::map<std::string, std::shared_ptr<const Schema>> properties_;
    std::set<std::string> required_properties_;
    std::vector<std::string> enum_values_;
    int min_length_;
    bool has_minimum_;
    int minimum_;
    std::shared_ptr<const Schema> items_;
    std::vector<std::shared_ptr<const Schema>> all_of_;

    // Check if it's possible to add constraints
    void checkAddConstraint() const;
    void checkAddPropertyConstraint() const;
};

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_VALIDATOR_SCHEMA_H_
