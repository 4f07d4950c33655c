#pragma once


/*
    -----------------------------------
    Stanza::ModelPath - Error addresses
    -----------------------------------
    A model path names the position of a value inside a decoded model and is
    the key errors are recorded under (`Person.Numbers[2]`). Paths are built
    one segment at a time while the decoder walks the body:

        - member segment: `Name` at the root, `.Name` below it
        - index segment: `[2]`
        - member names holding path syntax are quoted: `['a.b']`

    Rendering rules
        - A member is quoted when it contains `.`, `'`, `/`, `"`, `[`, `]`,
          `(`, `)`, a space, `\`, a control character, U+0085, U+2028 or
          U+2029
        - Inside the quotes `'` and `\` are backslash-escaped and control
          characters use JSON escapes; `"` is written as-is:
          `[0]['It"s a key']`
        - `combine_paths(prefix, relative)` joins a model name and a relative
          path: either side empty yields the other, a relative path starting
          with `[` is appended directly, anything else is joined with `.`
*/

/// @defgroup StanzaPath Model Paths
/// @ingroup Stanza
/// @brief Addressing of values inside a decoded model

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "stanza/config.hpp"

namespace Stanza {

    /// @ingroup StanzaPath
    /// @brief One step of a model path: a member name or a sequence index
    struct PathSegment {
        std::variant<std::string, std::size_t> step;

        [[nodiscard]] bool is_index() const noexcept { return std::holds_alternative<std::size_t>(step); }
        [[nodiscard]] std::size_t index() const { return std::get<std::size_t>(step); }
        [[nodiscard]] const std::string& name() const { return std::get<std::string>(step); }

        friend bool operator==(const PathSegment&, const PathSegment&) = default;
    };

    /// @ingroup StanzaPath
    /// @brief True when @p name must be written in the `['name']` form
    [[nodiscard]] STANZA_API bool requires_quoting(std::string_view name) noexcept;

    /// @ingroup StanzaPath
    /// @brief Appends the rendering of member @p name to @p path
    STANZA_API void append_member(std::string& path, std::string_view name);

    /// @ingroup StanzaPath
    /// @brief Appends `[index]` to @p path
    STANZA_API void append_index(std::string& path, std::size_t index);

    /// @ingroup StanzaPath
    /// @brief Renders a relative path from its segments (`[0].Items[2]`)
    [[nodiscard]] STANZA_API std::string render(std::span<const PathSegment> segments);

    /// @ingroup StanzaPath
    /// @brief Joins a model name prefix with a path relative to it
    ///
    /// @code
    /// combine_paths("", "Age");          // "Age"
    /// combine_paths("person", "");       // "person"
    /// combine_paths("names", "[1].Small"); // "names[1].Small"
    /// combine_paths("Person", "Name");   // "Person.Name"
    /// @endcode
    [[nodiscard]] STANZA_API std::string combine_paths(std::string_view prefix, std::string_view relative);

    /// @ingroup StanzaPath
    /// @brief Growable path with stack discipline, rooted at a model name
    ///
    /// @details
    /// `push_*` appends a segment and `pop` removes the most recent one, so
    /// one instance serves a whole recursive walk without copying prefixes.
    class ModelPath {
    public:
        ModelPath() = default;

        /// @brief Starts the path at @p root (the model name, possibly empty)
        STANZA_API explicit ModelPath(std::string_view root);

        STANZA_API void push_member(std::string_view name);
        STANZA_API void push_index(std::size_t index);

        /// @brief Drops the most recent segment; no-op at the root
        STANZA_API void pop() noexcept;

        [[nodiscard]] const std::string& str() const noexcept { return m_Rendered; }
        [[nodiscard]] std::size_t depth() const noexcept { return m_Marks.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Rendered.empty(); }

    private:
        std::string m_Rendered;
        std::vector<std::size_t> m_Marks;
    };

    /// @ingroup StanzaPath
    /// @brief Pushes one segment on construction and pops it on destruction
    class PathScope {
    public:
        PathScope(ModelPath& path, std::string_view member) : m_Path{ path } { m_Path.push_member(member); }
        PathScope(ModelPath& path, std::size_t index) : m_Path{ path } { m_Path.push_index(index); }
        ~PathScope() { m_Path.pop(); }

        PathScope(const PathScope&) = delete;
        PathScope& operator=(const PathScope&) = delete;

    private:
        ModelPath& m_Path;
    };

} // namespace Stanza
