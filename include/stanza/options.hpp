#pragma once


/*
    -----------------------
    Stanza configuration
    -----------------------
    This header defines the configuration structures of every Stanza layer.
    All of them are plain aggregates suitable for brace-initialization

    - `ParseOptions`: JSON reader strictness (comments, trailing commas,
      nesting depth)
    - `WriteOptions`: JSON writer layout (pretty printing, indentation, key
      ordering)
    - `DecodeOptions`: structured decoder behavior (empty-input semantics,
      reader options, validation collaborator)
    - `FormatterOptions`: input formatter surface (accepted media types and
      charsets, reader options)

    The error budget is not an option here: it belongs to the
    `ErrorCollection` a decode reports into (`set_max_allowed_errors`)
*/


#include <cstddef>
#include <string>
#include <vector>

/// @defgroup StanzaOptions Options
/// @ingroup Stanza
/// @brief Configuration objects for reading, writing, and decoding

namespace Stanza {

    class ModelMetadataProvider;

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// Strict RFC 8259 by default.
    ///
    /// `allow_comments`
    ///   - When `true`, `// ...` and `/* ... */` comments count as whitespace.
    /// `allow_trailing_commas`
    ///   - When `true`, `[1,2,]` and `{"a":1,}` are accepted.
    /// `max_depth`
    ///   - Maximum allowed nesting depth of arrays/objects; `0` means no limit.
    ///
    /// Example:
    /// @code
    /// ParseOptions opts;
    /// opts.allow_comments = true;
    /// opts.max_depth = 32;
    /// auto result = Stanza::parse(text, opts);
    /// @endcode
    struct ParseOptions {
        bool allow_comments = false; ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        size_t max_depth = 0; ///< Maximum allowed nesting depth (0 = unlimited)
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration options controlling JSON serialization (dumping).
    ///
    /// @details
    /// `pretty` enables newlines and indentation, `indent` is the number of
    /// spaces per level, `sort_keys` writes object members in lexicographic
    /// order instead of document order.
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
        bool sort_keys = false;     ///< Sort object keys before writing if true.
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration of a single structured decode
    ///
    /// @details
    /// `treat_empty_input_as_default_value`
    ///   - Empty body: `true` yields the target type's default value as a set
    ///     model, `false` yields "no value" without an error.
    ///   - Literal `null`: the model is null either way and is reported as set
    ///     only when this is `true`.
    /// `parse`
    ///   - Reader options. Request bodies are read strictly with a nesting
    ///     limit of 64.
    /// `metadata`
    ///   - Validation collaborator invoked after each object decodes cleanly;
    ///     `nullptr` skips validation. Not owned.
    struct DecodeOptions {
        bool treat_empty_input_as_default_value = false;
        ParseOptions parse{ .allow_comments = false, .allow_trailing_commas = false, .max_depth = 64 };
        const ModelMetadataProvider* metadata = nullptr;
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration of a `JsonInputFormatter`
    ///
    /// @details
    /// `supported_media_types` are tried in order and the first one is the
    /// formatter's default media type. `supported_encodings` lists the
    /// accepted `charset` parameter values (case-insensitive); a request
    /// without a charset is read as UTF-8.
    struct FormatterOptions {
        std::vector<std::string> supported_media_types{ "application/json", "text/json", "application/*+json" };
        std::vector<std::string> supported_encodings{ "utf-8" };
        ParseOptions parse{ .allow_comments = false, .allow_trailing_commas = false, .max_depth = 64 };
    };

} // namespace Stanza
