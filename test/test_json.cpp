#include <catch2/catch_all.hpp>

#include "stanza/json.hpp"

#include <cmath>
#include <limits>
#include <memory_resource>
#include <random>
#include <sstream>

#include <spdlog/fmt/fmt.h>

using namespace Catch;

namespace {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }

        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        char ascii_char() {
            std::uniform_int_distribution<int> dist(32, 126);
            return static_cast<char>(dist(eng));
        }

        std::string random_string(size_t max_len = 16) {
            size_t len = uniform_size(0, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(ascii_char());
            return s;
        }
    };

    Stanza::value random_json_value(rng& r, int depth = 0, int max_depth = 4);

    Stanza::value random_primitive(rng& r) {
        switch (r.uniform_size(0, 4)) {
            case 0: return Stanza::value{ nullptr };
            case 1: return Stanza::value{ r.coin() };
            case 2: return Stanza::value{ r.uniform_double() };
            case 3: {
                auto s = r.random_string();
                return Stanza::value{ s.c_str() };
            }
        }
        return Stanza::value{ nullptr };
    }

    Stanza::value random_array(rng& r, int depth, int max_depth) {
        auto res = Stanza::value{};
        auto& arr = res.as_array();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++)
            arr.emplace_back(random_json_value(r, depth + 1, max_depth));
        return res;
    }

    Stanza::value random_object(rng& r, int depth, int max_depth) {
        auto res = Stanza::value{};
        auto& obj = res.as_object();
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) {
            auto key = r.random_string();
            if (res.find(key)) continue;
            auto value = random_json_value(r, depth + 1, max_depth);
            obj.emplace_back(Stanza::string{ key.c_str(), res.resource() }, std::move(value));
        }
        return res;
    }

    Stanza::value random_json_value(rng& r, int depth, int max_depth) {
        if (depth >= max_depth) return random_primitive(r);

        size_t choice = r.uniform_size(0, 5);
        switch (choice) {
            case 0:
            case 1:
            return random_primitive(r);
            case 2:
            case 3:
            return random_array(r, depth, max_depth);
            case 4:
            case 5:
            return random_object(r, depth, max_depth);
        }
        return random_primitive(r);
    }

    Stanza::ParseResult parse_str(std::string_view s, const Stanza::ParseOptions& opts = {}) {
        return Stanza::parse(s, opts);
    }

    void expect_ok(std::string_view s, const Stanza::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE(r);
    }

    void expect_fail(std::string_view s, Stanza::ParseError::code code, const Stanza::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }
}


TEST_CASE("DOM Dump/parse Round-Trip") {
    rng r;

    for (int i = 0; i < 100; i++) {
        Stanza::value original = random_json_value(r);

        Stanza::WriteOptions opts;
        opts.pretty = (i % 2 == 0);

        std::string s = Stanza::dump(original, opts);

        auto parsed = Stanza::parse(s);
        REQUIRE(parsed.has_value());

        const Stanza::value& reparsed = parsed.value();

        if (reparsed != original) {
            fmt::print("Reparsed: {}\n", Stanza::dump(reparsed, {}));
            fmt::print("Original: {}\n", Stanza::dump(original, {}));
        }

        REQUIRE(reparsed == original);
    }
}

TEST_CASE("Parse/Dump/Parse Property on Random Text") {
    rng r;

    for (int i = 0; i < 100; i++) {
        std::string input = r.random_string(64);

        Stanza::ParseOptions opts;
        opts.allow_comments = true;
        opts.allow_trailing_commas = true;

        auto res = Stanza::parse(input, opts);
        if (!res.has_value()) continue;

        Stanza::value& v = res.value();

        std::string dumped = Stanza::dump(v, {.pretty = (i % 2 == 0)});
        auto res2 = Stanza::parse(dumped, opts);
        REQUIRE(res2.has_value());
        REQUIRE(res2.value() == v);
    }
}

TEST_CASE("Parse Primitives") {
    using Stanza::parse;

    auto n = parse("null");
    REQUIRE(n);
    REQUIRE(n->is_null());

    auto t = parse("true");
    REQUIRE(t);
    REQUIRE(t->is_bool());
    REQUIRE(t->as_bool() == true);

    auto num = parse("123.5e-1");
    REQUIRE(num);
    REQUIRE(num->as_number() == Approx(12.35));
}

TEST_CASE("Number Tokens Keep Their Lexeme") {
    auto r = Stanza::parse("[33767, 1.50, 2e3, -0]");
    REQUIRE(r);
    const auto& arr = r->as_array();

    REQUIRE(arr[0].as_number_token().lexeme == "33767");
    REQUIRE(arr[0].as_number_token().is_integral());
    REQUIRE(arr[1].as_number_token().lexeme == "1.50");
    REQUIRE_FALSE(arr[1].as_number_token().is_integral());
    REQUIRE(arr[2].as_number_token().lexeme == "2e3");
    REQUIRE_FALSE(arr[2].as_number_token().is_integral());
    REQUIRE(arr[2].as_number() == Approx(2000.0));
    REQUIRE(arr[3].as_number_token().lexeme == "-0");
}

TEST_CASE("Dump Writes Number Lexemes Verbatim") {
    auto r = Stanza::parse("{\"price\":1.50,\"big\":12345678901234567890}");
    REQUIRE(r);
    REQUIRE(Stanza::dump(*r) == "{\"price\":1.50,\"big\":12345678901234567890}");
}

TEST_CASE("Out-of-Range Magnitude Parses as Infinity") {
    auto r = Stanza::parse("1e999");
    REQUIRE(r);
    REQUIRE(std::isinf(r->as_number()));
    REQUIRE(r->as_number_token().lexeme == "1e999");
}

TEST_CASE("Parse String Escapes") {
    using Stanza::parse;

    auto r = parse(R"("line\nbreak")");
    REQUIRE(r);
    REQUIRE(r->as_string() == "line\nbreak");

    auto unicode = parse(R"("\u20AC")");
    REQUIRE(unicode);
    REQUIRE(unicode->as_string() == "\xE2\x82\xAC");
}

TEST_CASE("Reject Leading Zeros") {
    using Stanza::parse;

    auto r = parse("01");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().errc == Stanza::ParseError::code::invalid_number);
}

TEST_CASE("Reject Trailing Characters") {
    using Stanza::parse;

    auto r = parse("1 2");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().errc == Stanza::ParseError::code::trailing_characters);
}

TEST_CASE("Empty Array and Object Round-Trip") {
    Stanza::value arr;
    (void)arr.as_array();

    Stanza::value obj;
    (void)obj.as_object();

    auto r1 = Stanza::parse(Stanza::dump(arr));
    auto r2 = Stanza::parse(Stanza::dump(obj));

    REQUIRE(r1);
    REQUIRE(r1->is_array());
    REQUIRE(r1->as_array().empty());

    REQUIRE(r2);
    REQUIRE(r2->is_object());
    REQUIRE(r2->as_object().empty());
}

TEST_CASE("Object Operator[] Inserts Keys") {
    Stanza::value v;
    v["x"] = 1.0;

    REQUIRE(v.is_object());
    REQUIRE(v["x"].as_number() == Approx(1.0));
}

TEST_CASE("Object Members Keep Insertion Order") {
    Stanza::value v;
    v["zeta"] = 1.0;
    v["alpha"] = 2.0;
    v["mid"] = 3.0;

    REQUIRE(Stanza::dump(v) == R"({"zeta":1,"alpha":2,"mid":3})");
    REQUIRE(Stanza::dump(v, {.sort_keys = true}) == R"({"alpha":2,"mid":3,"zeta":1})");
}

TEST_CASE("Array Operator[] Grows and Fills with Null") {
    Stanza::value v;
    v["a"][3] = 42.0;

    auto& arr = v["a"].as_array();
    REQUIRE(arr.size() == 4);
    REQUIRE(arr[0].is_null());
    REQUIRE(arr[3].as_number() == Approx(42.0));
}

TEST_CASE("Line and Block Comments Are Accepted When Allowed") {
    std::string s = R"(
        // comment
        {
            "x": 1, /* comment */ "y": 2
        }
    )";

    Stanza::ParseOptions opts;
    opts.allow_comments = true;

    auto r = Stanza::parse(s, opts);
    REQUIRE(r);
    REQUIRE(r->as_object().size() == 2);
}

TEST_CASE("Comments Rejected When Not Allowed") {
    std::string s = "{ // comment\n \"x\": 1 }";

    Stanza::ParseOptions opts;
    opts.allow_comments = false;

    auto r = Stanza::parse(s, opts);
    REQUIRE_FALSE(r.has_value());
}

TEST_CASE("Trailing Commas Controlled by Option") {
    std::string s = "{ \"a\": 1, }";

    Stanza::ParseOptions strict;
    strict.allow_trailing_commas = false;

    auto strict_r = Stanza::parse(s, strict);
    REQUIRE_FALSE(strict_r);

    Stanza::ParseOptions relaxed;
    relaxed.allow_trailing_commas = true;

    auto relaxed_r = Stanza::parse(s, relaxed);
    REQUIRE(relaxed_r);
}

TEST_CASE("Valid Surrogate Pair Parses") {
    auto r = Stanza::parse(R"("\uD83D\uDE00")");
    REQUIRE(r);
    REQUIRE(r->as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("Unpaired Surrogate Rejected") {
    auto r = Stanza::parse(R"("\uD83D")");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Stanza::ParseError::code::invalid_unicode_escape);
}

TEST_CASE("Underflowing Magnitude Parses as Zero") {
    for (auto text : { "1e-400", "0.000001e-320", "123e-999999999999999999999" }) {
        INFO("parsing: " << text);
        auto r = Stanza::parse(text);
        REQUIRE(r);
        REQUIRE(r->as_number() == 0.0);
        REQUIRE_FALSE(std::signbit(r->as_number()));
        REQUIRE(r->as_number_token().lexeme == text);
    }

    auto neg = Stanza::parse("-1e-400");
    REQUIRE(neg);
    REQUIRE(neg->as_number() == 0.0);
    REQUIRE(std::signbit(neg->as_number()));

    auto big = Stanza::parse("0.001e400");
    REQUIRE(big);
    REQUIRE(std::isinf(big->as_number()));
}

TEST_CASE("Large Exponent Parses") {
    auto r = Stanza::parse("1e308");
    REQUIRE(r);
    REQUIRE(std::isfinite(r->as_number()));
}

TEST_CASE("NaN and Inf Serialize as Null") {
    Stanza::value v_nan{ std::numeric_limits<double>::quiet_NaN() };
    Stanza::value v_inf{ std::numeric_limits<double>::infinity() };

    REQUIRE(Stanza::dump(v_nan) == "null");
    REQUIRE(Stanza::dump(v_inf) == "null");
}

TEST_CASE("Error Position in Range") {
    std::string s = "{\n  \"x\": 1,\n  oops\n}";
    auto r = Stanza::parse(s);
    REQUIRE_FALSE(r);

    const auto& e = r.error();
    REQUIRE(e.offset <= s.size());
    REQUIRE(e.line == 3);
    REQUIRE(e.column >= 1);
    REQUIRE_FALSE(e.msg.empty());
}

TEST_CASE("Value Equality is Structural") {
    Stanza::value a;
    a["x"] = 1.0;
    a["y"].as_array().emplace_back(true);

    Stanza::value b;
    b["x"] = 1.0;
    b["y"].as_array().emplace_back(true);

    REQUIRE(a == b);
}

TEST_CASE("Regression: Empty Array Round-Trip") {
    std::string s = "[]";
    auto r1 = Stanza::parse(s);
    REQUIRE(r1);
    auto s2 = Stanza::dump(r1.value());
    auto r2 = Stanza::parse(s2);
    REQUIRE(r2);
    REQUIRE(r1.value() == r2.value());
}

TEST_CASE("Parse From Stream") {
    std::istringstream is{ R"({"a": [1, 2]})" };
    auto r = Stanza::parse(is);
    REQUIRE(r);
    REQUIRE(r->at("a").size() == 2);
}

struct CountingResource : std::pmr::memory_resource {
    size_t allocs = 0;
    size_t deallocs = 0;

    void* do_allocate(size_t bytes, size_t alignment) override {
        allocs++;
        return std::pmr::get_default_resource()->allocate(bytes, alignment);
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        deallocs++;
        return std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }
};

TEST_CASE("Value Uses Provided memory_resource") {
    CountingResource res;
    Stanza::value v{ &res };

    v["key"] = "value";
    v["arr"].as_array().emplace_back(123.0);

    REQUIRE(res.allocs > 0);
}

TEST_CASE("Parsed DOM Allocates From the Given Resource") {
    CountingResource res;
    {
        auto r = Stanza::parse(R"({"name": "a fairly long string that will not fit SSO", "list": [1, 2, 3]})", {}, &res);
        REQUIRE(r);
        REQUIRE(r->resource() == &res);
        REQUIRE(res.allocs > 0);
    }
    REQUIRE(res.deallocs == res.allocs);
}

TEST_CASE("as_array Converts Null to Empty Array") {
    Stanza::value v;
    REQUIRE(v.is_null());
    auto& arr = v.as_array();
    REQUIRE(v.is_array());
    REQUIRE(arr.empty());
}

TEST_CASE("operator[] String Inserts Null When Missing") {
    Stanza::value v;
    v["foo"];
    REQUIRE(v.is_object());
    REQUIRE(v["foo"].is_null());
}

TEST_CASE("operator[] Index Grows and Fills With Null") {
    Stanza::value v;
    v[3] = 42.0;
    auto& arr = v.as_array();
    REQUIRE(arr.size() == 4);
    REQUIRE(arr[0].is_null());
    REQUIRE(arr[3].as_number() == Approx(42.0));
}

TEST_CASE("RFC8259 - Top-Level Single Value with Whitespace") {
    expect_ok(" 42 ");
    expect_ok("\n\n {\"a\":1}  \t");
    expect_ok("[1, 2, 3]");
    expect_ok("null");
    expect_ok("\"string\"");
}

TEST_CASE("RFC8259 - Trailing Characters are Rejected") {
    expect_fail("null true", Stanza::ParseError::code::trailing_characters);
    expect_fail("{\"a\":1} 0", Stanza::ParseError::code::trailing_characters);
    expect_fail("[] [ ]", Stanza::ParseError::code::trailing_characters);
}

TEST_CASE("RFC8259 - non-JSON Whitespace is Rejected") {
    std::string s = "\xC2\xA0\x01";
    auto r = parse_str(s);
    REQUIRE_FALSE(r);
}

TEST_CASE("RFC8259 - Valid Numbers") {
    for (auto s : {
        "0",
        "123",
        "-0",
        "-123",
        "0.0",
        "-0.1",
        "10.5",
        "1e10",
        "1E10",
        "1e+10",
        "1e-10",
        "-1E-10"
    }) {
        INFO("parsing: " << s);
        auto r = parse_str(s);
        REQUIRE(r);
        REQUIRE(r->is_number());
    }
}

TEST_CASE("RFC8259 - Invalid Numbers are Rejected") {
    // Leading zeros
    expect_fail("01",     Stanza::ParseError::code::invalid_number);
    expect_fail("-01",    Stanza::ParseError::code::invalid_number);

    // Trailing decimal point / no digits
    expect_fail("1.",     Stanza::ParseError::code::invalid_number);
    expect_fail("1.e10",  Stanza::ParseError::code::invalid_number);
    expect_fail(".5",     Stanza::ParseError::code::invalid_number);

    // Malformed exponent
    expect_fail("1e",     Stanza::ParseError::code::invalid_number);
    expect_fail("1e+",    Stanza::ParseError::code::invalid_number);
    expect_fail("1e-",    Stanza::ParseError::code::invalid_number);
    expect_fail("1e1.2",  Stanza::ParseError::code::invalid_number);

    expect_fail("+1",     Stanza::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Valid String Escapes") {
    expect_ok("\"simple\"");
    expect_ok("\"quote: \\\"\"");
    expect_ok("\"backslash: \\\\\"");
    expect_ok("\"controls: \\b\\f\\n\\r\\t\"");
    expect_ok("\"solidus: \\/\"");
}

TEST_CASE("RFC8259 - Control Characters Must be Escaped") {
    std::string s = "\"Hello\nWorld\"";
    expect_fail(s, Stanza::ParseError::code::invalid_string);

    std::string s2 = "\"\x01\"";
    expect_fail(s2, Stanza::ParseError::code::invalid_string);
}

TEST_CASE("RFC8259 - Invalid Unicode Escapes") {
    expect_fail("\"\\u12\"", Stanza::ParseError::code::invalid_unicode_escape);
    expect_fail("\"\\uZZZZ\"", Stanza::ParseError::code::invalid_unicode_escape);
    expect_fail("\"\\uD800\"", Stanza::ParseError::code::invalid_unicode_escape);
    expect_fail("\"\\uD800abc\"", Stanza::ParseError::code::invalid_unicode_escape);
}

TEST_CASE("RFC8259 - Invalid Arrays") {
    expect_fail("[", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("[1", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("[1,", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("[1 2]", Stanza::ParseError::code::unexpected_character);
    expect_fail("[,1]", Stanza::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Trailing Comma Behavior") {
    Stanza::ParseOptions relaxed{};
    relaxed.allow_trailing_commas = true;

    expect_fail("[1,]", Stanza::ParseError::code::trailing_characters);

    auto r = Stanza::parse("[1,]", relaxed);
    REQUIRE(r);
    REQUIRE(r->is_array());
    REQUIRE(r->as_array().size() == 1);
}

TEST_CASE("RFC8259 - Invalid Objects") {
    expect_fail("{", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("{\"a\":1,", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("{a:1}", Stanza::ParseError::code::unexpected_character);
    expect_fail("{\"a\" 1}", Stanza::ParseError::code::unexpected_character);
    expect_fail("{,\"a\":1}", Stanza::ParseError::code::unexpected_character);
}

TEST_CASE("RFC8259 - Object Duplicate Names Last-Wins Semantics") {
    auto r = parse_str("{\"a\":1,\"b\":true,\"a\":2}");
    REQUIRE(r);
    auto& obj = r->as_object();
    REQUIRE(obj.size() == 2);
    REQUIRE(obj[0].first == "a");
    REQUIRE(r->at("a").as_number() == Approx(2.0));
}

TEST_CASE("Wide Object With Duplicate Names") {
    constexpr int k_Members = 50'000;
    std::string text = "{";
    for (int i = 0; i < k_Members; i++) text += fmt::format("\"k{}\":{},", i, i);
    text += "\"k0\":-1,\"k49999\":-2}";

    auto r = parse_str(text);
    REQUIRE(r);
    auto& obj = r->as_object();
    REQUIRE(obj.size() == k_Members);
    REQUIRE(obj.front().first == "k0");
    REQUIRE(obj.front().second.as_number() == Approx(-1.0));
    REQUIRE(obj.back().first == "k49999");
    REQUIRE(obj.back().second.as_number() == Approx(-2.0));
    REQUIRE(obj[1234].second.as_number() == Approx(1234.0));
}

TEST_CASE("RFC8259 - Valid UTF-8 in Strings") {
    expect_ok("\"caf\xC3\xA9\"");
    expect_ok("\"snowman: \xE2\x98\x83\"");
}

TEST_CASE("RFC8259 - Invalid UTF-8 is Rejected") {
    // Overlong encoding of '/'
    std::string s = "\"\xC0\xAF\"";
    expect_fail(s, Stanza::ParseError::code::invalid_string);
}

TEST_CASE("RFC8259 - NaN and Infinity tokens are rejected") {
    expect_fail("NaN",      Stanza::ParseError::code::unexpected_character);
    expect_fail("Infinity", Stanza::ParseError::code::unexpected_character);
    expect_fail("-Infinity", Stanza::ParseError::code::unexpected_character);
}

TEST_CASE("Empty Input is Rejected") {
    expect_fail("", Stanza::ParseError::code::unexpected_end_of_input);
    expect_fail("   \n\t  ", Stanza::ParseError::code::unexpected_end_of_input);
}

TEST_CASE("Max depth is enforced") {
    Stanza::ParseOptions opts{};
    opts.max_depth = 3;

    expect_ok("[[[]]]", opts);
    expect_fail("[[[[]]]]", Stanza::ParseError::code::depth_limit_exceeded, opts);
    expect_ok("{ \"1\": { \"2\": {}}}", opts);
    expect_fail("{ \"1\": { \"2\": { \"3\": {}}}}", Stanza::ParseError::code::depth_limit_exceeded, opts);
}
