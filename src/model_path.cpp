#include "stanza/model_path.hpp"

#include <charconv>

namespace Stanza {

    namespace {
        // U+0085, U+2028 and U+2029 in UTF-8
        constexpr std::string_view k_NextLine = "\xC2\x85";
        constexpr std::string_view k_LineSeparator = "\xE2\x80\xA8";
        constexpr std::string_view k_ParagraphSeparator = "\xE2\x80\xA9";

        constexpr bool is_path_syntax(unsigned char c) noexcept {
            switch (c) {
            case '.': case '\'': case '/': case '"':
            case '[': case ']': case '(': case ')':
            case ' ': case '\\':
                return true;
            default:
                return c < 0x20;
            }
        }

        void append_quoted(std::string& out, std::string_view name) {
            static constexpr char hex[] = "0123456789abcdef";
            out += "['";
            for (size_t i = 0; i < name.size(); i++) {
                const auto c = static_cast<unsigned char>(name[i]);
                switch (c) {
                case '\'': out += "\\'"; continue;
                case '\\': out += "\\\\"; continue;
                case '\b': out += "\\b"; continue;
                case '\f': out += "\\f"; continue;
                case '\n': out += "\\n"; continue;
                case '\r': out += "\\r"; continue;
                case '\t': out += "\\t"; continue;
                default: break;
                }
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0xF]);
                    continue;
                }

                const auto rest = name.substr(i);
                if (rest.starts_with(k_NextLine)) {
                    out += "\\u0085";
                    i += k_NextLine.size() - 1;
                } else if (rest.starts_with(k_LineSeparator)) {
                    out += "\\u2028";
                    i += k_LineSeparator.size() - 1;
                } else if (rest.starts_with(k_ParagraphSeparator)) {
                    out += "\\u2029";
                    i += k_ParagraphSeparator.size() - 1;
                } else {
                    out.push_back(static_cast<char>(c));
                }
            }
            out += "']";
        }
    } // namespace

    bool requires_quoting(std::string_view name) noexcept {
        for (unsigned char c : name) {
            if (is_path_syntax(c)) return true;
        }
        return name.find(k_NextLine) != std::string_view::npos
            || name.find(k_LineSeparator) != std::string_view::npos
            || name.find(k_ParagraphSeparator) != std::string_view::npos;
    }

    void append_member(std::string& path, std::string_view name) {
        if (requires_quoting(name)) {
            append_quoted(path, name);
            return;
        }
        if (!path.empty()) path.push_back('.');
        path.append(name);
    }

    void append_index(std::string& path, std::size_t index) {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), index);
        path.push_back('[');
        path.append(buf, ptr);
        path.push_back(']');
    }

    std::string render(std::span<const PathSegment> segments) {
        std::string out;
        for (const auto& seg : segments) {
            if (seg.is_index()) append_index(out, seg.index());
            else append_member(out, seg.name());
        }
        return out;
    }

    std::string combine_paths(std::string_view prefix, std::string_view relative) {
        if (prefix.empty()) return std::string{ relative };
        if (relative.empty()) return std::string{ prefix };

        std::string out{ prefix };
        if (!relative.starts_with('[')) out.push_back('.');
        out.append(relative);
        return out;
    }

    ModelPath::ModelPath(std::string_view root) : m_Rendered{ root } {}

    void ModelPath::push_member(std::string_view name) {
        m_Marks.push_back(m_Rendered.size());
        append_member(m_Rendered, name);
    }

    void ModelPath::push_index(std::size_t index) {
        m_Marks.push_back(m_Rendered.size());
        append_index(m_Rendered, index);
    }

    void ModelPath::pop() noexcept {
        if (m_Marks.empty()) return;
        m_Rendered.resize(m_Marks.back());
        m_Marks.pop_back();
    }

} // namespace Stanza
