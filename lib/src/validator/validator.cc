#include <cpp-zmq-plugin/validator/validator.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".validator"
#include <leatherman/logging/logging.hpp>

#include <leatherman/locale/locale.hpp>

#include <rapidjson/document.h>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wextra"
#pragma GCC diagnostic ignored "-Wignored-qualifiers"
#include <valijson/adapters/rapidjson_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validation_results.hpp>
#include <valijson/validator.hpp>
#pragma GCC diagnostic pop

namespace ZmqPlugin {

namespace lth_loc = leatherman::locale;

///
/// Auxiliary functions
///

std::string getValidationError(valijson::ValidationResults& validation_results) {
    std::string err_msg {};
    valijson::ValidationResults::Error error;
    unsigned int err_idx { 0 };

    while (validation_results.popError(error)) {
        if (!err_msg.empty()) {
            err_msg += "  - ";
        }
        err_idx++;
        err_msg += "ERROR " + std::to_string(err_idx) + ":";
        for (const auto& context_element : error.context) {
            err_msg += " " + context_element;
        }
        if (!error.description.empty()) {
            err_msg += " (" + error.description + ")";
        }
    }

    return  err_msg;
}

std::shared_ptr<const valijson::Schema> compileSchema(const Schema& schema) {
    auto json_schema = schema.getJsonSchema();
    const rapidjson::Value& raw_schema = json_schema.getRaw();
    valijson::adapters::RapidJsonAdapter adapted_schema { raw_schema };
    valijson::SchemaParser parser { valijson::SchemaParser::kDraft4 };
    auto compiled = std::make_shared<valijson::Schema>();

    try {
        parser.populateSchema(adapted_schema, *compiled);
    } catch (std::exception& e) {
        throw schema_error {
            lth_loc::format("failed to compile schema '{1}': {2}",
                            schema.getName(), e.what()) };
    }

    LOG_TRACE("Compiled schema '{1}'", schema.getName());
    return compiled;
}

bool validateJsonContainer(const lth_jc::JsonContainer& data,
                           const valijson::Schema& schema,
                           std::string& err_msg) {
    valijson::Validator validator {};
    const rapidjson::Value& raw_data = data.getRaw();
    valijson::adapters::RapidJsonAdapter adapted_document { raw_data };
    valijson::ValidationResults validation_results;

    auto success = validator.validate(schema, adapted_document, &validation_results);

    if (!success) {
        err_msg = getValidationError(validation_results);
        LOG_DEBUG("Schema validation failure: {1}", err_msg);
    }

    return success;
}

///
/// Public API
///

Validator::Validator()
        : schema_map_ {},
          lookup_mutex_ {} {
}

Validator::Validator(Validator&& other_validator)
        : schema_map_ { std::move(other_validator.schema_map_) },
          lookup_mutex_ {} {
}

void Validator::registerSchema(const Schema& schema) {
    auto compiled = compileSchema(schema);

    Util::lock_guard<Util::mutex> lock(lookup_mutex_);
    auto schema_name = schema.getName();
    if (includesSchema_(schema_name)) {
        throw schema_redefinition_error {
            lth_loc::format("Schema '{1}' already defined.", schema_name) };
    }

    schema_map_.insert(std::make_pair(schema_name,
                                      CompiledSchema { schema, compiled }));
}

void Validator::validate(const lth_jc::JsonContainer& data,
                         std::string schema_name) const {
    Util::unique_lock<Util::mutex> lock(lookup_mutex_);
    if (!includesSchema_(schema_name)) {
        throw schema_not_found_error {
            lth_loc::format("'{1}' is not a registered schema", schema_name) };
    }
    auto raw_schema = schema_map_.at(schema_name).raw;
    lock.unlock();

    // we can freely unlock. When a schema has been set it cannot be modified

    std::string err_msg {};
    if (!validateJsonContainer(data, *raw_schema, err_msg)) {
        throw validation_error {
            lth_loc::format("does not match schema '{1}': {2}",
                            schema_name, err_msg) };
    }
}

bool Validator::includesSchema(std::string schema_name) const {
    Util::lock_guard<Util::mutex> lock(lookup_mutex_);
    return includesSchema_(schema_name);
}

std::vector<std::string> Validator::getSchemaNames() const {
    Util::lock_guard<Util::mutex> lock(lookup_mutex_);
    std::vector<std::string> names {};

    for (const auto& entry : schema_map_) {
        names.push_back(entry.first);
    }

    return names;
}

bool Validator::includesSchema_(const std::string& schema_name) const {
    return schema_map_.find(schema_name) != schema_map_.end();
}

}  // namespace ZmqPlugin
