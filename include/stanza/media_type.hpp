#pragma once


/*
    -------------------------------------------
    Stanza::MediaType - Content-Type matching
    -------------------------------------------
    A parsed `type/subtype; name=value` media type, used to decide whether a
    request body is one a formatter reads. Matching is case-insensitive and
    understands structured-syntax suffixes (`application/problem+json`).

        auto mt = Stanza::MediaType::parse("application/vnd.acme+json; charset=utf-8");
        mt->subtype_without_suffix(); // "vnd.acme"
        mt->suffix();                 // "json"
        mt->charset();                // "utf-8"

    `a.is_subset_of(b)` answers "does every media type `a` describes also fall
    under `b`". Wildcards are only meaningful on the `b` side, so
    `application/*` is not a subset of `application/json`.
*/

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "stanza/config.hpp"

namespace Stanza {

    /// @ingroup Stanza
    /// @brief Parsed media type with parameters
    class MediaType {
    public:
        using parameter_list = std::vector<std::pair<std::string, std::string>>;

        /// @brief Parses @p text; `std::nullopt` if it is not a media type
        [[nodiscard]] STANZA_API static std::optional<MediaType> parse(std::string_view text);

        [[nodiscard]] const std::string& type() const noexcept { return m_Type; }
        [[nodiscard]] const std::string& subtype() const noexcept { return m_Subtype; }

        /// @brief `vnd.acme` of `vnd.acme+json`; the whole subtype if it has no suffix
        [[nodiscard]] STANZA_API std::string_view subtype_without_suffix() const noexcept;

        /// @brief `json` of `vnd.acme+json`; empty if there is no suffix
        [[nodiscard]] STANZA_API std::string_view suffix() const noexcept;

        [[nodiscard]] bool has_suffix() const noexcept { return !suffix().empty(); }

        [[nodiscard]] bool matches_all_types() const noexcept { return m_Type == "*"; }
        [[nodiscard]] bool matches_all_subtypes() const noexcept { return m_Subtype == "*"; }
        [[nodiscard]] bool matches_all_subtypes_without_suffix() const noexcept { return subtype_without_suffix() == "*"; }

        [[nodiscard]] const parameter_list& parameters() const noexcept { return m_Parameters; }

        /// @brief Value of parameter @p name (case-insensitive), unquoted
        [[nodiscard]] STANZA_API std::optional<std::string_view> parameter(std::string_view name) const noexcept;

        [[nodiscard]] std::optional<std::string_view> charset() const noexcept { return parameter("charset"); }

        /// @brief True when this media type falls under @p set
        [[nodiscard]] STANZA_API bool is_subset_of(const MediaType& set) const noexcept;

        /// @brief `type/subtype; name=value`, re-quoting values where needed
        [[nodiscard]] STANZA_API std::string to_string() const;

    private:
        MediaType() = default;

        std::string m_Type;
        std::string m_Subtype;
        parameter_list m_Parameters;

        bool matches_subtype(const MediaType& set) const noexcept;
        bool contains_parameters_of(const MediaType& set) const noexcept;
    };

    /// @brief ASCII case-insensitive equality
    [[nodiscard]] STANZA_API bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace Stanza
