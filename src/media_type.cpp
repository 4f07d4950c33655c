#include "stanza/media_type.hpp"

namespace Stanza {

    namespace {
        constexpr char ascii_lower(char c) noexcept {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        // RFC 7230 tchar
        constexpr bool is_token_char(char c) noexcept {
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
            switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
            case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
                return true;
            default:
                return false;
            }
        }

        class Scanner {
        public:
            explicit Scanner(std::string_view text) : m_Text{ text } {}

            void skip_ows() noexcept {
                while (m_Idx < m_Text.size() && (m_Text[m_Idx] == ' ' || m_Text[m_Idx] == '\t')) m_Idx++;
            }

            [[nodiscard]] bool at_end() const noexcept { return m_Idx >= m_Text.size(); }

            bool consume(char c) noexcept {
                if (at_end() || m_Text[m_Idx] != c) return false;
                m_Idx++;
                return true;
            }

            std::string_view token() noexcept {
                const size_t start = m_Idx;
                while (m_Idx < m_Text.size() && is_token_char(m_Text[m_Idx])) m_Idx++;
                return m_Text.substr(start, m_Idx - start);
            }

            std::optional<std::string> quoted_string() {
                if (!consume('"')) return std::nullopt;
                std::string out;
                while (!at_end()) {
                    const char c = m_Text[m_Idx++];
                    if (c == '"') return out;
                    if (c == '\\') {
                        if (at_end()) return std::nullopt;
                        out += m_Text[m_Idx++];
                    } else {
                        out += c;
                    }
                }
                return std::nullopt;
            }

            [[nodiscard]] bool peek(char c) const noexcept { return !at_end() && m_Text[m_Idx] == c; }

        private:
            std::string_view m_Text;
            size_t m_Idx = 0;
        };

        bool needs_quotes(std::string_view value) noexcept {
            if (value.empty()) return true;
            for (char c : value) {
                if (!is_token_char(c)) return true;
            }
            return false;
        }
    } // namespace

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
        if (lhs.size() != rhs.size()) return false;
        for (size_t i = 0; i < lhs.size(); i++) {
            if (ascii_lower(lhs[i]) != ascii_lower(rhs[i])) return false;
        }
        return true;
    }

    std::optional<MediaType> MediaType::parse(std::string_view text) {
        Scanner s{ text };
        MediaType mt;

        s.skip_ows();
        auto type = s.token();
        if (type.empty() || !s.consume('/')) return std::nullopt;
        auto subtype = s.token();
        if (subtype.empty()) return std::nullopt;
        mt.m_Type = type;
        mt.m_Subtype = subtype;

        s.skip_ows();
        while (s.consume(';')) {
            s.skip_ows();
            auto name = s.token();
            if (name.empty() || !s.consume('=')) return std::nullopt;

            std::string value;
            if (s.peek('"')) {
                auto quoted = s.quoted_string();
                if (!quoted) return std::nullopt;
                value = std::move(*quoted);
            } else {
                value = s.token();
                if (value.empty()) return std::nullopt;
            }
            mt.m_Parameters.emplace_back(std::string{ name }, std::move(value));
            s.skip_ows();
        }

        if (!s.at_end()) return std::nullopt;
        return mt;
    }

    std::string_view MediaType::subtype_without_suffix() const noexcept {
        const std::string_view sub{ m_Subtype };
        const auto plus = sub.rfind('+');
        return plus == std::string_view::npos ? sub : sub.substr(0, plus);
    }

    std::string_view MediaType::suffix() const noexcept {
        const std::string_view sub{ m_Subtype };
        const auto plus = sub.rfind('+');
        return plus == std::string_view::npos ? std::string_view{} : sub.substr(plus + 1);
    }

    std::optional<std::string_view> MediaType::parameter(std::string_view name) const noexcept {
        for (const auto& [key, value] : m_Parameters) {
            if (iequals(key, name)) return std::string_view{ value };
        }
        return std::nullopt;
    }

    bool MediaType::is_subset_of(const MediaType& set) const noexcept {
        const bool type_matches = set.matches_all_types() || iequals(set.m_Type, m_Type);
        return type_matches && matches_subtype(set) && contains_parameters_of(set);
    }

    bool MediaType::matches_subtype(const MediaType& set) const noexcept {
        if (set.matches_all_subtypes()) return true;

        if (set.has_suffix() && has_suffix()) {
            const bool without_suffix = set.matches_all_subtypes_without_suffix()
                || iequals(set.subtype_without_suffix(), subtype_without_suffix());
            return without_suffix && iequals(set.suffix(), suffix());
        }

        // `json` covers both `json` and `vnd.acme+json`.
        return iequals(set.m_Subtype, m_Subtype) || (has_suffix() && iequals(set.m_Subtype, suffix()));
    }

    bool MediaType::contains_parameters_of(const MediaType& set) const noexcept {
        for (const auto& [name, value] : set.m_Parameters) {
            if (name == "*") continue;
            auto mine = parameter(name);
            if (!mine || !iequals(*mine, value)) return false;
        }
        return true;
    }

    std::string MediaType::to_string() const {
        std::string out = m_Type + '/' + m_Subtype;
        for (const auto& [name, value] : m_Parameters) {
            out += "; ";
            out += name;
            out += '=';
            if (!needs_quotes(value)) {
                out += value;
                continue;
            }
            out += '"';
            for (char c : value) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
        }
        return out;
    }

} // namespace Stanza
