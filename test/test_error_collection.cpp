#include <catch2/catch_all.hpp>

#include "stanza/error_collection.hpp"
#include "stanza/json.hpp"

#include <stdexcept>

using Code = Stanza::ModelError::code;

TEST_CASE("Errors Group by Key in First-Write Order") {
    Stanza::ErrorCollection errors;
    REQUIRE(errors.is_valid());
    REQUIRE(errors.empty());

    REQUIRE(errors.try_add("b", "first"));
    REQUIRE(errors.try_add("a", Stanza::ModelError{ Code::conversion_failed, "second", std::nullopt }));
    REQUIRE(errors.try_add("b", "third"));

    REQUIRE(errors.error_count() == 3);
    REQUIRE_FALSE(errors.is_valid());
    REQUIRE(errors.keys() == std::vector<std::string>{ "b", "a" });

    const auto& b = errors.errors("b");
    REQUIRE(b.size() == 2);
    REQUIRE(b[0].msg == "first");
    REQUIRE(b[0].errc == Code::custom);
    REQUIRE(b[1].msg == "third");
    REQUIRE(errors.errors("a")[0].errc == Code::conversion_failed);
}

TEST_CASE("Lookup of an Absent Key is Empty") {
    Stanza::ErrorCollection errors;
    errors.try_add("Name", "required");

    REQUIRE(errors.contains("Name"));
    REQUIRE_FALSE(errors.contains("name"));
    REQUIRE(errors.errors("missing").empty());
}

TEST_CASE("Budget Exhaustion Records a Single Root Error") {
    Stanza::ErrorCollection errors;
    errors.set_max_allowed_errors(3);

    REQUIRE(errors.try_add("key1", "error1"));
    REQUIRE(errors.try_add("key2", "error2"));
    REQUIRE_FALSE(errors.has_reached_max_errors());

    REQUIRE_FALSE(errors.try_add("Age", "refused"));
    REQUIRE(errors.has_reached_max_errors());
    REQUIRE_FALSE(errors.contains("Age"));
    REQUIRE(errors.error_count() == 3);

    const auto& root = errors.errors("");
    REQUIRE(root.size() == 1);
    REQUIRE(root[0].errc == Code::too_many_errors);

    // Later adds are dropped silently.
    REQUIRE_FALSE(errors.try_add("Other", "refused"));
    REQUIRE(errors.errors("").size() == 1);
    REQUIRE(errors.error_count() == 3);
}

TEST_CASE("Budget of One Refuses Every Error") {
    Stanza::ErrorCollection errors;
    errors.set_max_allowed_errors(1);

    REQUIRE_FALSE(errors.try_add("x", "refused"));
    REQUIRE(errors.keys() == std::vector<std::string>{ "" });
    REQUIRE(errors.errors("")[0].errc == Code::too_many_errors);
}

TEST_CASE("Budget of Zero is Rejected") {
    Stanza::ErrorCollection errors;
    REQUIRE_THROWS_AS(errors.set_max_allowed_errors(0), std::invalid_argument);
    REQUIRE(errors.max_allowed_errors() == Stanza::ErrorCollection::unbounded);
}

TEST_CASE("Clear Resets Count and Budget State") {
    Stanza::ErrorCollection errors;
    errors.set_max_allowed_errors(2);
    errors.try_add("a", "x");
    errors.try_add("b", "y");
    REQUIRE(errors.has_reached_max_errors());

    errors.clear();
    REQUIRE(errors.empty());
    REQUIRE(errors.error_count() == 0);
    REQUIRE_FALSE(errors.has_reached_max_errors());
    REQUIRE(errors.max_allowed_errors() == 2);
    REQUIRE(errors.try_add("a", "x"));
}

TEST_CASE("Model Error Equality Ignores Parse Detail") {
    Stanza::ModelError a{ Code::invalid_json, "bad", Stanza::ParseError::make(Stanza::ParseError::code::invalid_number, 0, 1, 1, "x") };
    Stanza::ModelError b{ Code::invalid_json, "bad", std::nullopt };
    REQUIRE(a == b);
    REQUIRE_FALSE(a == Stanza::ModelError{ Code::custom, "bad", std::nullopt });
}

TEST_CASE("Code Names") {
    REQUIRE(Stanza::to_string(Code::too_many_errors) == "too_many_errors");
    REQUIRE(Stanza::to_string(Code::value_out_of_range) == "value_out_of_range");
}

TEST_CASE("Errors Render as a JSON Object of Message Lists") {
    Stanza::ErrorCollection errors;
    errors.try_add("Person.Name", "The Name field is required.");
    errors.try_add("[0]['It\"s a key']", "out of range");
    errors.try_add("Person.Name", "again");

    auto v = Stanza::to_value(errors);
    REQUIRE(Stanza::dump(v) ==
            R"({"Person.Name":["The Name field is required.","again"],"[0]['It\"s a key']":["out of range"]})");
}
