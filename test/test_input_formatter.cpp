#include <catch2/catch_all.hpp>

#include "stanza/input_formatter.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

using Code = Stanza::ModelError::code;

namespace {

    struct Order {
        int id = 0;
        std::vector<std::string> items;
    };

    void describe(Stanza::type_tag<Order>, Stanza::ObjectBuilder<Order>& b) {
        b.named("Order");
        b.field("Id", &Order::id).required().range(1, 1000);
        b.field("Items", &Order::items);
    }
}

TEST_CASE("Default Media Type") {
    Stanza::JsonInputFormatter formatter;
    REQUIRE(formatter.default_media_type().to_string() == "application/json");
    REQUIRE(formatter.supported_media_types().size() == 3);
    REQUIRE(formatter.supported_encodings() == std::vector<std::string>{ "utf-8" });
}

TEST_CASE("Readable Content Types") {
    Stanza::JsonInputFormatter formatter;

    for (auto ct : { "application/json", "text/json", "application/json; charset=utf-8", "application/json;v=2",
                     "application/some.entity+json", "application/some.entity+json;v=2", "text/some.entity+json",
                     "application/problem+json", "application/x+json", "TEXT/JSON" }) {
        INFO("content type: " << ct);
        REQUIRE(formatter.can_read(ct));
    }
}

TEST_CASE("Unreadable Content Types") {
    Stanza::JsonInputFormatter formatter;

    for (auto ct : { "", "invalid", "application/*", "text/*", "*/*", "application/x+*", "application/xml", "text/xml",
                     "text/plain", "application/some.entity+xml" }) {
        INFO("content type: " << ct);
        REQUIRE_FALSE(formatter.can_read(ct));
    }
}

TEST_CASE("Custom Media Types") {
    Stanza::FormatterOptions opts;
    opts.supported_media_types = { "application/vnd.orders+json" };
    Stanza::JsonInputFormatter formatter{ opts };

    REQUIRE(formatter.can_read("application/vnd.orders+json"));
    REQUIRE_FALSE(formatter.can_read("application/json"));
}

TEST_CASE("Invalid Configured Media Types Throw") {
    Stanza::FormatterOptions bad;
    bad.supported_media_types = { "application/json", "not a media type" };
    REQUIRE_THROWS_AS(Stanza::JsonInputFormatter{ bad }, std::invalid_argument);

    Stanza::FormatterOptions none;
    none.supported_media_types.clear();
    REQUIRE_THROWS_AS(Stanza::JsonInputFormatter{ none }, std::invalid_argument);
}

TEST_CASE("Read Decodes Into the Context's Model Type") {
    Stanza::JsonInputFormatter formatter;
    Stanza::ErrorCollection errors;
    Stanza::InputFormatterContext ctx{ "application/json", "order", errors, Stanza::describe<Order>() };

    auto r = formatter.read(ctx, R"({"Id": 7, "Items": ["a", "b"]})");
    REQUIRE_FALSE(r.has_error());
    auto order = r.model_as<Order>();
    REQUIRE(order.id == 7);
    REQUIRE(order.items == std::vector<std::string>{ "a", "b" });
}

TEST_CASE("Read Reports Under the Model Name and Validates") {
    Stanza::JsonInputFormatter formatter;
    Stanza::ErrorCollection errors;
    Stanza::InputFormatterContext ctx{ "application/json", "order", errors, Stanza::describe<Order>() };

    auto r = formatter.read(ctx, R"({"Id": 7000, "Items": []})");
    REQUIRE(r.has_error());
    REQUIRE(errors.keys() == std::vector<std::string>{ "order.Id" });
    REQUIRE(errors.errors("order.Id")[0].errc == Code::validation_failed);
}

TEST_CASE("Read From a Stream") {
    Stanza::JsonInputFormatter formatter;
    Stanza::ErrorCollection errors;
    Stanza::InputFormatterContext ctx{ "text/json", "", errors, Stanza::describe<std::vector<int>>() };

    std::istringstream body{ "[0, 23, 300]" };
    auto r = formatter.read(ctx, body);
    REQUIRE_FALSE(r.has_error());
    REQUIRE(r.model_as<std::vector<int>>() == std::vector<int>{ 0, 23, 300 });
}

TEST_CASE("Unsupported Charset") {
    Stanza::JsonInputFormatter formatter;
    Stanza::ErrorCollection errors;
    Stanza::InputFormatterContext ctx{ "application/json; charset=latin1", "order", errors, Stanza::describe<Order>() };

    auto r = formatter.read(ctx, R"({"Id": 7})");
    REQUIRE(r.has_error());
    REQUIRE(errors.keys() == std::vector<std::string>{ "order" });
    REQUIRE(errors.errors("order")[0].errc == Code::unsupported_content_type);

    Stanza::ErrorCollection ok;
    Stanza::InputFormatterContext upper{ "application/json; charset=UTF-8", "order", ok, Stanza::describe<Order>() };
    REQUIRE_FALSE(formatter.read(upper, R"({"Id": 7})").has_error());
}

TEST_CASE("Empty Body Follows the Context Option") {
    Stanza::JsonInputFormatter formatter;
    Stanza::ErrorCollection errors;

    Stanza::InputFormatterContext no_value{ "application/json", "", errors, Stanza::describe<int>() };
    REQUIRE_FALSE(formatter.read(no_value, "").is_model_set());

    Stanza::InputFormatterContext defaulted{ "application/json", "", errors, Stanza::describe<int>(), true };
    auto r = formatter.read(defaulted, "");
    REQUIRE(r.is_model_set());
    REQUIRE(r.model_as<int>() == 0);
    REQUIRE(errors.is_valid());
}

TEST_CASE("Missing Model Type Throws") {
    Stanza::JsonInputFormatter formatter;
    Stanza::ErrorCollection errors;
    Stanza::InputFormatterContext ctx{ "application/json", "", errors, nullptr };
    REQUIRE_THROWS_AS(formatter.read(ctx, "1"), std::invalid_argument);
}
