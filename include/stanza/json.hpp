#pragma once


/*
    -------------------------------------
    Stanza JSON reader and writer
    -------------------------------------
    Free functions turning request-body text into the ordered DOM
    (`Stanza::value`) and back

    - Parsing:
        * `ParseResult parse(std::string_view, const ParseOptions& = {}, memory_resource* = default)`
        * `ParseResult parse(std::istream&, const ParseOptions& = {})`
        * RFC 8259 by default; comments, trailing commas and a depth limit
          are opt-in through `ParseOptions`
        * The memory resource overload lets a caller put the whole DOM into
          an arena it releases in one step
    - Serialization:
        * `std::string dump(const value&, const WriteOptions& = {})`
        * `void dump(const value&, std::ostream&, const WriteOptions& = {})`
*/

/// @defgroup StanzaAPI JSON Reading and Writing
/// @ingroup Stanza
/// @brief Free functions for parsing and writing JSON

#include <expected>
#include <string>
#include <string_view>
#include <iosfwd>
#include <memory_resource>

#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Result of every `parse(...)` overload
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document from a string view
    ///
    /// @details
    /// On success the returned DOM and all of its nested allocations come from
    /// @p res. On failure, a `ParseError` describing the location and reason is
    /// returned instead.
    ///
    /// Example:
    /// @code
    /// std::pmr::monotonic_buffer_resource arena;
    /// auto res = Stanza::parse(R"({"x":42})", {}, &arena);
    /// if (!res) std::cerr << res.error().msg << '\n';
    /// @endcode
    ///
    /// @param input UTF-8 encoded JSON text to parse
    /// @param opts Parsing configuration options
    /// @param res Memory resource for the resulting DOM
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {},
                                               std::pmr::memory_resource* res = std::pmr::get_default_resource());

    /// @ingroup StanzaAPI
    /// @brief Reads @p is to the end and parses the contents as JSON
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a JSON DOM value to a string
    [[nodiscard]] STANZA_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a JSON DOM value to an output stream
    STANZA_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

} // namespace Stanza
