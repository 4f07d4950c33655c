#include "stanza/json.hpp"

#include <algorithm>
#include <sstream>
#include <charconv>
#include <cmath>
#include <memory_resource>
#include <unordered_map>
#include <vector>


namespace Stanza {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts, std::pmr::memory_resource* res) {
        return detail::parse_impl(input, opts, res);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(oss.str(), opts, std::pmr::get_default_resource());
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::dump_impl(v, oss, opts, 0);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::dump_impl(v, os, opts, 0);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        template<typename T>
        using expected_t = std::expected<T, ParseError>;
        using expected_void = expected_t<void>;

        [[nodiscard]] constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
        [[nodiscard]] constexpr bool is_ws(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

        // Magnitude of a well-formed number lexeme is below 1, judged from its
        // first significant digit and exponent without converting it.
        bool is_below_one(std::string_view lexeme) noexcept {
            size_t i = lexeme.front() == '-' ? 1 : 0;
            long long lead = 0;
            bool found = false;

            const size_t int_start = i;
            while (i < lexeme.size() && is_digit(lexeme[i])) i++;
            for (size_t k = int_start; k < i; k++) {
                if (lexeme[k] != '0') {
                    lead = static_cast<long long>(i - k) - 1;
                    found = true;
                    break;
                }
            }

            if (i < lexeme.size() && lexeme[i] == '.') {
                i++;
                long long pos = -1;
                for (; i < lexeme.size() && is_digit(lexeme[i]); i++, pos--) {
                    if (!found && lexeme[i] != '0') {
                        lead = pos;
                        found = true;
                    }
                }
            }
            if (!found) return true;

            long long exp = 0;
            bool exp_negative = false;
            if (i < lexeme.size() && (lexeme[i] == 'e' || lexeme[i] == 'E')) {
                i++;
                if (i < lexeme.size() && (lexeme[i] == '+' || lexeme[i] == '-')) exp_negative = lexeme[i++] == '-';
                for (; i < lexeme.size() && is_digit(lexeme[i]); i++) {
                    // Saturate; anything this large decides the outcome on its own.
                    if (exp < 1'000'000'000) exp = exp * 10 + (lexeme[i] - '0');
                }
            }
            return lead + (exp_negative ? -exp : exp) < 0;
        }

        // Well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, nothing above U+10FFFF.
        bool is_valid_utf8(std::string_view s) noexcept {
            const auto* data = reinterpret_cast<const unsigned char*>(s.data());
            const size_t n = s.size();
            size_t i = 0;
            while (i < n) {
                const unsigned char c = data[i];
                if (c <= 0x7F) { i++; continue; }

                size_t len = 0;
                unsigned char lo = 0x80, hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) len = 2;
                else if (c == 0xE0) { len = 3; lo = 0xA0; }
                else if (c == 0xED) { len = 3; hi = 0x9F; }
                else if (c >= 0xE1 && c <= 0xEF) len = 3;
                else if (c == 0xF0) { len = 4; lo = 0x90; }
                else if (c == 0xF4) { len = 4; hi = 0x8F; }
                else if (c >= 0xF1 && c <= 0xF3) len = 4;
                else return false;

                if (i + len > n) return false;
                if (data[i + 1] < lo || data[i + 1] > hi) return false;
                for (size_t k = 2; k < len; k++) {
                    if ((data[i + k] & 0xC0) != 0x80) return false;
                }
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp > 0x10FFFF) cp = 0xFFFD;
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        class Reader {
        public:
            Reader(std::string_view t, const ParseOptions& o, std::pmr::memory_resource* r)
                : m_Text{ t }, m_Opts{ o }, m_MemRes{ r } {}

            ParseResult document() {
                auto v = parse_value();
                if (!v) return std::unexpected(std::move(v.error()));
                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (!eof()) return fail(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value");
                return *std::move(v);
            }

        private:
            std::string_view m_Text;
            const ParseOptions& m_Opts;
            std::pmr::memory_resource* m_MemRes;
            size_t m_Idx = 0;
            size_t m_Line = 1;
            size_t m_Column = 1;
            size_t m_Depth = 0;

            // Scoped nesting level; fails once ParseOptions::max_depth would be exceeded.
            struct DepthGuard {
                Reader& r;
                bool active = false;

                explicit DepthGuard(Reader& reader) : r(reader) {
                    if (r.m_Opts.max_depth == 0 || r.m_Depth < r.m_Opts.max_depth) {
                        r.m_Depth++;
                        active = true;
                    }
                }
                ~DepthGuard() { if (active) r.m_Depth--; }
                DepthGuard(const DepthGuard&) = delete;
                DepthGuard& operator=(const DepthGuard&) = delete;
            };

            [[nodiscard]] bool eof() const noexcept { return m_Idx >= m_Text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : m_Text[m_Idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (m_Idx + 1 < m_Text.size()) ? m_Text[m_Idx + 1] : '\0'; }

            char get() {
                if (eof()) return '\0';
                char c = m_Text[m_Idx++];
                if (c == '\n') {
                    m_Line++;
                    m_Column = 1;
                } else m_Column++;
                return c;
            }

            bool consume(char c) {
                if (peek() != c || eof()) return false;
                get();
                return true;
            }

            [[nodiscard]] std::unexpected<ParseError> fail(ParseError::code code, std::string_view msg) const {
                return std::unexpected(ParseError::make(code, m_Idx, m_Line, m_Column, msg));
            }

            expected_void skip_ws() {
                while (!eof()) {
                    const char c = peek();
                    if (is_ws(c)) {
                        get();
                        continue;
                    }
                    if (!m_Opts.allow_comments || c != '/') break;

                    const char next = peek_next();
                    if (next == '/') {
                        while (!eof() && peek() != '\n') get();
                        continue;
                    }
                    if (next != '*') break;

                    get();
                    get();
                    bool closed = false;
                    while (!eof()) {
                        if (get() == '*' && peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (!closed) return fail(ParseError::code::unexpected_end_of_input, "Nonterminated block comment");
                }
                return {};
            }

            expected_void literal(std::string_view word) {
                for (char expected : word) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Truncated literal");
                    if (get() != expected) return fail(ParseError::code::unexpected_character, "Invalid literal");
                }
                return {};
            }

            expected_t<uint16_t> hex4() {
                uint16_t val = 0;
                for (int i = 0; i < 4; i++) {
                    if (eof()) return fail(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape");
                    const char h = get();
                    unsigned digit = 0;
                    if (h >= '0' && h <= '9') digit = h - '0';
                    else if (h >= 'A' && h <= 'F') digit = 10 + (h - 'A');
                    else if (h >= 'a' && h <= 'f') digit = 10 + (h - 'a');
                    else return fail(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape");
                    val = static_cast<uint16_t>((val << 4) | digit);
                }
                return val;
            }

            expected_void unicode_escape(string& out) {
                auto first = hex4();
                if (!first) return std::unexpected(std::move(first.error()));

                uint32_t codepoint = *first;
                if (*first >= 0xDC00 && *first <= 0xDFFF) return fail(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate");
                if (*first >= 0xD800 && *first <= 0xDBFF) {
                    if (!(consume('\\') && consume('u'))) return fail(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate");
                    auto second = hex4();
                    if (!second) return std::unexpected(std::move(second.error()));
                    if (*second < 0xDC00 || *second > 0xDFFF) return fail(ParseError::code::invalid_unicode_escape, "Invalid low surrogate");
                    codepoint = 0x10000u + ((static_cast<uint32_t>(*first - 0xD800) << 10) | static_cast<uint32_t>(*second - 0xDC00));
                }
                append_utf8(codepoint, out);
                return {};
            }

            expected_t<string> parse_string() {
                if (!consume('"')) return fail(ParseError::code::invalid_string, "Expected '\"' to start a string");

                string out{ allocator_type(m_MemRes) };
                while (!eof()) {
                    const char c = get();
                    if (c == '"') {
                        if (!is_valid_utf8(out)) return fail(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string");
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20) return fail(ParseError::code::invalid_string, "Control character in string");
                    if (c != '\\') {
                        out.push_back(c);
                        continue;
                    }
                    if (eof()) return fail(ParseError::code::invalid_escape, "Unfinished escape sequence");
                    switch (get()) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u':
                        if (auto r = unicode_escape(out); !r) return std::unexpected(std::move(r.error()));
                        break;
                    default: return fail(ParseError::code::invalid_escape, "Invalid escape sequence");
                    }
                }
                return fail(ParseError::code::unexpected_end_of_input, "Nonterminated string");
            }

            expected_t<number> parse_number() {
                const size_t start = m_Idx;

                if (consume('-') && !is_digit(peek())) return fail(ParseError::code::unexpected_character, "Expected digit after '-'");

                const char first_digit = get();
                if (!is_digit(first_digit)) return fail(ParseError::code::invalid_number, "Expected digit");
                if (first_digit == '0' && is_digit(peek())) return fail(ParseError::code::invalid_number, "Leading zeros disallowed");
                while (is_digit(peek())) get();

                if (consume('.')) {
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit after '.'");
                    while (is_digit(peek())) get();
                }

                if (peek() == 'e' || peek() == 'E') {
                    get();
                    if (peek() == '+' || peek() == '-') get();
                    if (!is_digit(peek())) return fail(ParseError::code::invalid_number, "Expected digit in exponent");
                    while (is_digit(peek())) get();

                    const char c = peek();
                    if (!(c == '\0' || c == ',' || c == ']' || c == '}' || is_ws(c) || c == '/'))
                        return fail(ParseError::code::invalid_number, "Invalid character in exponent");
                }

                const auto lexeme = m_Text.substr(start, m_Idx - start);
                double res = 0.0;
                auto fc = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), res);
                // Magnitudes beyond double keep their lexeme; exact targets convert from it.
                if (fc.ec == std::errc::result_out_of_range) {
                    const bool negative = lexeme.front() == '-';
                    if (is_below_one(lexeme)) res = negative ? -0.0 : 0.0;
                    else res = negative ? -HUGE_VAL : HUGE_VAL;
                } else if (fc.ec != std::errc{}) return fail(ParseError::code::invalid_number, "Failed to parse number");
                return number{ res, string{ lexeme.begin(), lexeme.end(), m_MemRes } };
            }

            expected_t<value> parse_array() {
                DepthGuard guard{ *this };
                if (!guard.active) return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                if (!consume('[')) return fail(ParseError::code::unexpected_character, "Expected '[' to start array");

                array arr{ allocator_type(m_MemRes) };

                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (consume(']')) return value{ std::move(arr), m_MemRes };

                while (true) {
                    auto elem = parse_value();
                    if (!elem) return std::unexpected(std::move(elem.error()));
                    arr.emplace_back(std::move(*elem));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));

                    if (consume(']')) break;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated array, expected ',' or ']'");
                    if (!consume(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or ']' in array");

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (peek() == ']') {
                        if (!m_Opts.allow_trailing_commas) return fail(ParseError::code::trailing_characters, "Trailing commas not allowed");
                        get();
                        break;
                    }
                }
                return value{ std::move(arr), m_MemRes };
            }

            expected_t<value> parse_object() {
                DepthGuard guard{ *this };
                if (!guard.active) return fail(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded");
                if (!consume('{')) return fail(ParseError::code::unexpected_character, "Expected '{' to start object");

                object obj{ allocator_type(m_MemRes) };
                // Position of each member name in obj, for duplicate detection.
                std::pmr::unordered_map<string, size_t> positions(m_MemRes);

                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (consume('}')) return value{ std::move(obj), m_MemRes };

                while (true) {
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected '}' or string key");
                    if (peek() != '"') return fail(ParseError::code::unexpected_character, "Expected \" to start object key");

                    auto key = parse_string();
                    if (!key) return std::unexpected(std::move(key.error()));

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key");
                    if (!consume(':')) return fail(ParseError::code::unexpected_character, "Expected ':' after object key");

                    auto val = parse_value();
                    if (!val) return std::unexpected(std::move(val.error()));

                    // Last value wins, first position is kept.
                    if (auto [it, inserted] = positions.try_emplace(*key, obj.size()); !inserted) {
                        obj[it->second].second = std::move(*val);
                    } else {
                        obj.emplace_back(std::move(*key), std::move(*val));
                    }

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));

                    if (consume('}')) break;
                    if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ',' or '}'");
                    if (!consume(',')) return fail(ParseError::code::unexpected_character, "Expected ',' or '}' in object");

                    if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                    if (m_Opts.allow_trailing_commas && consume('}')) break;
                }
                return value{ std::move(obj), m_MemRes };
            }

            expected_t<value> parse_value() {
                if (auto ws = skip_ws(); !ws) return std::unexpected(std::move(ws.error()));
                if (eof()) return fail(ParseError::code::unexpected_end_of_input, "Expected JSON value");

                const char c = peek();
                switch (c) {
                case 'n':
                    if (auto r = literal("null"); !r) return std::unexpected(std::move(r.error()));
                    return value{ nullptr, m_MemRes };
                case 't':
                    if (auto r = literal("true"); !r) return std::unexpected(std::move(r.error()));
                    return value{ true, m_MemRes };
                case 'f':
                    if (auto r = literal("false"); !r) return std::unexpected(std::move(r.error()));
                    return value{ false, m_MemRes };
                case '"': {
                    auto str = parse_string();
                    if (!str) return std::unexpected(std::move(str.error()));
                    return value{ std::move(*str), m_MemRes };
                }
                case '[': return parse_array();
                case '{': return parse_object();
                default:
                    if (c == '-' || is_digit(c)) {
                        auto num = parse_number();
                        if (!num) return std::unexpected(std::move(num.error()));
                        return value{ std::move(*num), m_MemRes };
                    }
                    if (c == '.') return fail(ParseError::code::invalid_number, "Fractional values must start with a 0");
                    return fail(ParseError::code::unexpected_character, "Unexpected character while parsing value");
                }
            }
        };

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts, std::pmr::memory_resource* res) {
            Reader reader{ text, opts, res };
            return reader.document();
        }
#pragma endregion
#pragma region Serializer

        // ================================
        // Internal serializer implementation
        // ================================

        void dump_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789ABCDEF";
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) os << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
                    else os.put(static_cast<char>(c));
                    break;
                }
            }
            os.put('"');
        }

        void dump_indent(std::ostream& os, size_t depth, const WriteOptions& opts) {
            if (!opts.pretty || opts.indent == 0) return;
            for (size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        void dump_number(const number& n, std::ostream& os) {
            if (!n.lexeme.empty()) {
                os << n.lexeme;
                return;
            }
            if (!std::isfinite(n.value)) {
                os << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), n.value, std::chars_format::general);
            if (ec != std::errc{}) os << "0";
            else os.write(buf, ptr - buf);
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts, size_t depth) {
            switch (v.type()) {
            case kind::null: os << "null"; return;
            case kind::boolean: os << (v.as_bool() ? "true" : "false"); return;
            case kind::number: dump_number(v.as_number_token(), os); return;
            case kind::string: dump_string(v.as_string(), os); return;
            case kind::array: {
                const auto& arr = v.as_array();
                os.put('[');
                if (arr.empty()) {
                    os.put(']');
                    return;
                }
                if (opts.pretty) os.put('\n');
                for (size_t i = 0; i < arr.size(); i++) {
                    dump_indent(os, depth + 1, opts);
                    dump_impl(arr[i], os, opts, depth + 1);
                    if (i + 1 < arr.size()) os.put(',');
                    if (opts.pretty) os.put('\n');
                }
                dump_indent(os, depth, opts);
                os.put(']');
                return;
            }
            case kind::object: {
                const auto& obj = v.as_object();
                os.put('{');
                if (obj.empty()) {
                    os.put('}');
                    return;
                }

                std::vector<const member*> order;
                order.reserve(obj.size());
                for (const auto& m : obj) order.push_back(&m);
                if (opts.sort_keys) {
                    std::stable_sort(order.begin(), order.end(), [](const member* a, const member* b) { return a->first < b->first; });
                }

                if (opts.pretty) os.put('\n');
                for (size_t i = 0; i < order.size(); i++) {
                    dump_indent(os, depth + 1, opts);
                    dump_string(order[i]->first, os);
                    os << (opts.pretty ? ": " : ":");
                    dump_impl(order[i]->second, os, opts, depth + 1);
                    if (i + 1 < order.size()) os.put(',');
                    if (opts.pretty) os.put('\n');
                }
                dump_indent(os, depth, opts);
                os.put('}');
                return;
            }
            }
            os << "null";
        }

#pragma endregion

    } // namespace detail

} // namespace Stanza
