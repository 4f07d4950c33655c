#pragma once


/*
    -----------------------------------------------------
    Stanza::ParseError - Structured JSON syntax reporting
    -----------------------------------------------------
    `Stanza::ParseError` describes a failure that occurred while reading the
    JSON text of a request body. It is the only error the reader produces;
    the decoder turns it into a single root-level model error (see
    `error_collection.hpp`) and keeps the structure attached for callers
    that want line/column information

    ------
    Fields
    ------
    - `code errc`: failure category
    - `size_t offset`: byte offset of the failure, in `[0, input.size()]`
    - `size_t line`, `size_t column`: 1-based position of the failure
    - `std::string msg`: human-readable description, not stable for
      programmatic use
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Parsing Errors
/// @ingroup Stanza
/// @brief Error codes and structures produced by the JSON reader
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Structured error information produced during JSON parsing.
    struct ParseError {
        /// @brief Enumeration of possible error categories detected by the parser.
        ///
        /// @details
        /// - `unexpected_character`: a character not valid in the current state
        /// - `invalid_number`: number does not match the JSON grammar (`012`, `1.`, `1e+`)
        /// - `invalid_string`: unescaped control character, bad UTF-8
        /// - `invalid_escape`: unknown escape such as `\k`
        /// - `invalid_unicode_escape`: malformed `\uXXXX` or unpaired surrogate
        /// - `unexpected_end_of_input`: input ended before a complete value
        /// - `trailing_characters`: content after the top-level value, or a
        ///   trailing comma when those are not allowed
        /// - `depth_limit_exceeded`: nesting deeper than `ParseOptions::max_depth`
        enum class code : uint8_t {
            unexpected_character,
            invalid_number,
            invalid_string,
            invalid_escape,
            invalid_unicode_escape,
            unexpected_end_of_input,
            trailing_characters,
            depth_limit_exceeded,
        };

        code errc{};          ///< The classification of the parsing error.
        std::size_t offset{}; ///< Byte offset from the beginning of the input.
        std::size_t line{};   ///< Line number where the error occurred (1-based).
        std::size_t column{}; ///< Column number where the error occurred (1-based).
        std::string msg{};    ///< Human-readable diagnostic message.

        /// @brief Constructs a fully-populated `ParseError` instance.
        [[nodiscard]] STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Returns the enumerator name of @p c (e.g. `"invalid_number"`)
    [[nodiscard]] STANZA_API std::string_view to_string(ParseError::code c) noexcept;

} // namespace Stanza
