#include "tests/test.hpp"

#include <cpp-zmq-plugin/validator/validator.hpp>

namespace ZmqPlugin {

static Schema getSpamSchema() {
    Schema count { "count", TypeConstraint::Int };
    count.addMinimumConstraint(0);

    Schema schema { "spam" };
    schema.addConstraint("name", TypeConstraint::String, true);
    schema.addConstraint("count", count, false);
    return schema;
}

TEST_CASE("Validator::registerSchema", "[validation]") {
    Validator validator {};

    SECTION("registers a schema") {
        REQUIRE_NOTHROW(validator.registerSchema(getSpamSchema()));
        REQUIRE(validator.includesSchema("spam"));
        REQUIRE(validator.getSchemaNames() == std::vector<std::string> { "spam" });
    }

    SECTION("throws a schema_redefinition_error in case of duplicates") {
        validator.registerSchema(getSpamSchema());
        REQUIRE_THROWS_AS(validator.registerSchema(getSpamSchema()),
                          schema_redefinition_error);
    }
}

TEST_CASE("Validator::validate", "[validation]") {
    Validator validator {};
    validator.registerSchema(getSpamSchema());

    SECTION("validates a matching document") {
        lth_jc::JsonContainer data { R"({"name":"foo", "count":2})" };
        REQUIRE_NOTHROW(validator.validate(data, "spam"));
    }

    SECTION("throws a validation_error in case of missing required field") {
        lth_jc::JsonContainer data { R"({"count":2})" };
        REQUIRE_THROWS_AS(validator.validate(data, "spam"), validation_error);
    }

    SECTION("throws a validation_error in case of wrong type") {
        lth_jc::JsonContainer data { R"({"name":42})" };
        REQUIRE_THROWS_AS(validator.validate(data, "spam"), validation_error);
    }

    SECTION("throws a validation_error in case of value below the minimum") {
        lth_jc::JsonContainer data { R"({"name":"foo", "count":-1})" };
        REQUIRE_THROWS_AS(validator.validate(data, "spam"), validation_error);
    }

    SECTION("throws a schema_not_found_error in case of unknown schema") {
        lth_jc::JsonContainer data { R"({"name":"foo"})" };
        REQUIRE_THROWS_AS(validator.validate(data, "eggs"), schema_not_found_error);
    }

    SECTION("the error message reports the failure context") {
        lth_jc::JsonContainer data { R"({"count":2})" };

        try {
            validator.validate(data, "spam");
            FAIL("did not throw");
        } catch (const validation_error& e) {
            std::string msg { e.what() };
            REQUIRE(msg.find("ERROR 1:") != std::string::npos);
            REQUIRE(msg.find("spam") != std::string::npos);
        }
    }
}

TEST_CASE("Validator::validate - composed schemas", "[validation]") {
    auto base = std::make_shared<Schema>("base");
    base->addConstraint("name", TypeConstraint::String, true);

    Schema derived { "derived" };
    derived.addAllOf(base);
    derived.addConstraint("flag", TypeConstraint::Bool, true);

    Validator validator {};
    validator.registerSchema(derived);

    SECTION("requires both the base and the derived constraints") {
        REQUIRE_NOTHROW(validator.validate(
            lth_jc::JsonContainer { R"({"name":"foo", "flag":true})" }, "derived"));
        REQUIRE_THROWS_AS(validator.validate(
            lth_jc::JsonContainer { R"({"flag":true})" }, "derived"),
            validation_error);
        REQUIRE_THROWS_AS(validator.validate(
            lth_jc::JsonContainer { R"({"name":"foo"})" }, "derived"),
            validation_error);
    }
}

TEST_CASE("Validator - parsed schemas", "[validation]") {
    Validator validator {};
    validator.registerSchema(
        Schema { "positive", lth_jc::JsonContainer { R"({"type":"integer","minimum":1})" } });

    SECTION("validates with the parsed document") {
        REQUIRE_NOTHROW(validator.validate(lth_jc::JsonContainer { "3" }, "positive"));
        REQUIRE_THROWS_AS(validator.validate(lth_jc::JsonContainer { "0" }, "positive"),
                          validation_error);
    }
}

}  // namespace ZmqPlugin
