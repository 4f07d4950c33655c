#include <catch2/catch_all.hpp>

#include "stanza/model_path.hpp"

#include <vector>

TEST_CASE("Member and Index Segments Render") {
    Stanza::ModelPath path;
    path.push_member("Person");
    path.push_member("Numbers");
    path.push_index(2);

    REQUIRE(path.str() == "Person.Numbers[2]");
    REQUIRE(path.depth() == 3);
}

TEST_CASE("Root Name Prefixes Every Path") {
    Stanza::ModelPath path{ "names" };
    path.push_index(1);
    path.push_member("Small");
    REQUIRE(path.str() == "names[1].Small");

    Stanza::ModelPath bare;
    bare.push_index(0);
    REQUIRE(bare.str() == "[0]");
}

TEST_CASE("Pop Restores the Previous Path") {
    Stanza::ModelPath path{ "root" };
    path.push_member("a");
    path.push_index(10);
    path.pop();
    REQUIRE(path.str() == "root.a");
    path.pop();
    REQUIRE(path.str() == "root");

    // Popping past the root is a no-op.
    path.pop();
    REQUIRE(path.str() == "root");
    REQUIRE(path.depth() == 0);
}

TEST_CASE("PathScope Pops on Exit") {
    Stanza::ModelPath path;
    {
        Stanza::PathScope outer{ path, std::string_view{ "Items" } };
        {
            Stanza::PathScope inner{ path, std::size_t{ 4 } };
            REQUIRE(path.str() == "Items[4]");
        }
        REQUIRE(path.str() == "Items");
    }
    REQUIRE(path.empty());
}

TEST_CASE("Member Names With Path Syntax are Quoted") {
    Stanza::ModelPath path;
    path.push_index(0);
    path.push_member("It[s a key");
    REQUIRE(path.str() == "[0]['It[s a key']");

    Stanza::ModelPath quotes;
    quotes.push_index(0);
    quotes.push_member("It\"s a key");
    REQUIRE(quotes.str() == "[0]['It\"s a key']");

    Stanza::ModelPath dotted{ "root" };
    dotted.push_member("a.b");
    REQUIRE(dotted.str() == "root['a.b']");
}

TEST_CASE("Quoted Names Escape Apostrophes, Backslashes and Controls") {
    std::string out;
    Stanza::append_member(out, "it's");
    REQUIRE(out == "['it\\'s']");

    out.clear();
    Stanza::append_member(out, "a\\b");
    REQUIRE(out == "['a\\\\b']");

    out.clear();
    Stanza::append_member(out, "tab\there");
    REQUIRE(out == "['tab\\there']");

    out.clear();
    Stanza::append_member(out, std::string_view{ "nul\x01", 4 });
    REQUIRE(out == "['nul\\u0001']");

    out.clear();
    Stanza::append_member(out, "line\xE2\x80\xA8sep");
    REQUIRE(out == "['line\\u2028sep']");
}

TEST_CASE("Requires Quoting") {
    for (auto name : { "a.b", "a'b", "a/b", "a\"b", "a[b", "a]b", "a(b", "a)b", "a b", "a\\b", "a\nb", "a\xC2\x85" "b" }) {
        INFO("name: " << name);
        REQUIRE(Stanza::requires_quoting(name));
    }
    for (auto name : { "Name", "first_name", "x-y", "caf\xC3\xA9", "a+b", "123" }) {
        INFO("name: " << name);
        REQUIRE_FALSE(Stanza::requires_quoting(name));
    }
}

TEST_CASE("Render Segment List") {
    std::vector<Stanza::PathSegment> segments{
        { std::string{ "Orders" } },
        { std::size_t{ 3 } },
        { std::string{ "Line Items" } },
        { std::size_t{ 0 } },
    };
    REQUIRE(Stanza::render(segments) == "Orders[3]['Line Items'][0]");
    REQUIRE(segments[1].is_index());
    REQUIRE(segments[1].index() == 3);
    REQUIRE(segments[0].name() == "Orders");
}

TEST_CASE("Combine Paths") {
    REQUIRE(Stanza::combine_paths("", "Name") == "Name");
    REQUIRE(Stanza::combine_paths("Person", "") == "Person");
    REQUIRE(Stanza::combine_paths("Person", "Name") == "Person.Name");
    REQUIRE(Stanza::combine_paths("Person", "[0]") == "Person[0]");
    REQUIRE(Stanza::combine_paths("", "") == "");
}
