#ifndef CPP_ZMQ_PLUGIN_SRC_VALIDATOR_VALIDATOR_H_
#define CPP_ZMQ_PLUGIN_SRC_VALIDATOR_VALIDATOR_H_

#include <cpp-zmq-plugin/validator/schema.hpp>
#include <cpp-zmq-plugin/util/thread.hpp>
#include <cpp-zmq-plugin/export.h>

#include <map>
#include <memory>
#include <vector>

// valijson forward declarations
namespace valijson {
    class Schema;
}

namespace ZmqPlugin {

//
// Errors
//

/// General validator error
class LIBCPP_ZMQ_PLUGIN_EXPORT validator_error : public std::runtime_error  {
  public:
    explicit validator_error(std::string const& msg)
        : std::runtime_error(msg) {}
};

class LIBCPP_ZMQ_PLUGIN_EXPORT schema_redefinition_error : public validator_error  {
  public:
    explicit schema_redefinition_error(std::string const& msg)
        : validator_error(msg) {}
};

class LIBCPP_ZMQ_PLUGIN_EXPORT schema_not_found_error : public validator_error  {
  public:
    explicit schema_not_found_error(std::string const& msg)
        : validator_error(msg) {}
};

class LIBCPP_ZMQ_PLUGIN_EXPORT validation_error : public validator_error {
  public:
    explicit validation_error(std::string const& msg)
        : validator_error(msg) {}
};

//
// Validator
//

class LIBCPP_ZMQ_PLUGIN_EXPORT Validator {
  public:
    Validator();

    // NB: Validator is thread-safe; it employs a mutex for that. As a
    //     consequence, Validator instances are not copyable.
    Validator(Validator&& other_validator);

    // Compile the schema and store it with its name.
    // Throw a schema_redefinition_error in case a schema with the
    // same name was already registered.
    // Throw a schema_error in case the schema cannot be compiled.
    void registerSchema(const Schema& schema);

    // Validates data with the specified schema.
    // Throw a schema_not_found error in case the specified schema
    // was not registered.
    // Throw a validation_error in case the data does not match the
    // specified schema.
    void validate(const lth_jc::JsonContainer& data, std::string schema_name) const;

    bool includesSchema(std::string schema_name) const;
    std::vector<std::string> getSchemaNames() const;

  private:
    struct CompiledSchema {
        Schema schema;
        std::shared_ptr<const valijson::Schema> raw;
    };

    std::map<std::string, CompiledSchema> schema_map_;
    mutable Util::mutex lookup_mutex_;

    bool includesSchema_(const std::string& schema_name) const;
};

}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_VALIDATOR_VALIDATOR_H_
