#include <catch2/catch_all.hpp>

#include "stanza/media_type.hpp"

TEST_CASE("Media Type Components") {
    auto mt = Stanza::MediaType::parse("application/vnd.acme+json; charset=utf-8");
    REQUIRE(mt);
    REQUIRE(mt->type() == "application");
    REQUIRE(mt->subtype() == "vnd.acme+json");
    REQUIRE(mt->subtype_without_suffix() == "vnd.acme");
    REQUIRE(mt->suffix() == "json");
    REQUIRE(mt->has_suffix());
    REQUIRE(mt->charset() == "utf-8");
    REQUIRE(mt->parameter("CHARSET") == "utf-8");
    REQUIRE_FALSE(mt->parameter("v"));
}

TEST_CASE("Media Type Without Suffix") {
    auto mt = Stanza::MediaType::parse("text/json");
    REQUIRE(mt);
    REQUIRE(mt->subtype_without_suffix() == "json");
    REQUIRE(mt->suffix().empty());
    REQUIRE_FALSE(mt->charset());
}

TEST_CASE("Quoted Parameters") {
    auto mt = Stanza::MediaType::parse(R"(application/json;profile="a b \"c\"" ; v=2)");
    REQUIRE(mt);
    REQUIRE(mt->parameter("profile") == "a b \"c\"");
    REQUIRE(mt->parameter("v") == "2");
    REQUIRE(mt->to_string() == R"(application/json; profile="a b \"c\""; v=2)");
}

TEST_CASE("Malformed Media Types") {
    for (auto text : { "", "invalid", "application/", "/json", "application/json;", "application/json; charset",
                       "application/json; charset=", "application/json garbage", "application/json; p=\"open" }) {
        INFO("text: " << text);
        REQUIRE_FALSE(Stanza::MediaType::parse(text));
    }
}

TEST_CASE("Subset Matching") {
    auto subset = [](std::string_view a, std::string_view b) {
        auto lhs = Stanza::MediaType::parse(a);
        auto rhs = Stanza::MediaType::parse(b);
        REQUIRE(lhs);
        REQUIRE(rhs);
        return lhs->is_subset_of(*rhs);
    };

    REQUIRE(subset("application/json", "application/json"));
    REQUIRE(subset("APPLICATION/JSON", "application/json"));
    REQUIRE(subset("application/json; v=2", "application/json"));
    REQUIRE(subset("application/some.entity+json", "application/json"));
    REQUIRE(subset("text/some.entity+json", "text/json"));
    REQUIRE(subset("application/problem+json", "application/*+json"));
    REQUIRE(subset("application/json", "*/*"));
    REQUIRE(subset("application/xml", "application/*"));

    REQUIRE_FALSE(subset("application/*", "application/json"));
    REQUIRE_FALSE(subset("*/*", "application/json"));
    REQUIRE_FALSE(subset("application/x+*", "application/*+json"));
    REQUIRE_FALSE(subset("application/json", "text/json"));
    REQUIRE_FALSE(subset("application/problem+xml", "application/*+json"));
    REQUIRE_FALSE(subset("application/json", "application/*+json"));
}

TEST_CASE("Parameters of the Set Must be Present") {
    auto request = Stanza::MediaType::parse("application/json; charset=UTF-8");
    auto wants_utf8 = Stanza::MediaType::parse("application/json; charset=utf-8");
    auto wants_v2 = Stanza::MediaType::parse("application/json; v=2");
    REQUIRE(request);
    REQUIRE(wants_utf8);
    REQUIRE(wants_v2);

    REQUIRE(request->is_subset_of(*wants_utf8));
    REQUIRE_FALSE(request->is_subset_of(*wants_v2));
}

TEST_CASE("Case-Insensitive Comparison") {
    REQUIRE(Stanza::iequals("Content-Type", "content-type"));
    REQUIRE_FALSE(Stanza::iequals("json", "jsonx"));
}
