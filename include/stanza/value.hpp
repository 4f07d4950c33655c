#pragma once


/*
    ------------------------------------
    Stanza::value - Ordered JSON DOM node
    ------------------------------------
    The `Stanza::value` type represents any JSON value read from a request
    body:
        - null
        - boolean
        - number (as double, with the lexeme it was written with)
        - string
        - array
        - object (members kept in document order)
    It is the intermediate form between the raw body and the type-directed
    decoder, and the form error collections are rendered into

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects, number lexemes)
    - The decoder parses every body into a per-call monotonic arena, so the
      whole tree is released in one step once the model has been built
    - Copy construction/assignment deep-copies into the source's allocator
    - Move construction/assignment steals the allocator and storage

    -------
    Numbers
    -------
    - Every parsed number keeps its source text in `number::lexeme`, which
      lets integer and decimal targets convert without going through
      `double` (`9007199254740993` stays exact)
    - Numbers built in code carry a lexeme only when built from integers

    -------
    Objects
    -------
    - `object` is a vector of `member`s in document order; lookups are linear
    - Duplicate names inside one JSON object keep the position of the first
      occurrence and the value of the last one (last-wins)

    -------------
    Thread-Safety
    -------------
    - Separate `value` instances may be used from separate threads
    - Concurrent access to the same instance must be externally synchronized
*/

/// @defgroup Stanza Stanza request-body decoding library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue DOM Value
/// @ingroup Stanza

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include "stanza/config.hpp"

namespace Stanza {
    /// @brief Enumerates the possible JSON value kinds held by Stanza::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number, ///< JSON number value
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief Array type used by Stanza::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief A single `name: value` pair of a JSON object
    using member = std::pair<string, value>;

    /// @ingroup StanzaValue
    /// @brief Object type used by Stanza::value, in document order
    using object = pmr_vector<member>;

    /// @ingroup StanzaValue
    /// @brief JSON number as read from text.
    ///
    /// @details
    /// `value` holds the parsed `double`. `lexeme` holds the exact characters
    /// of the source token (e.g. `"33767"`, `"1.50"`, `"2e3"`). Equality only
    /// looks at `value`, so `1.0` and `1` compare equal.
    struct number {
        double value{};  ///< Parsed value
        string lexeme{}; ///< Source text; may be empty for numbers built in code

        /// @brief True when the lexeme has no fraction or exponent part
        [[nodiscard]] STANZA_API bool is_integral() const noexcept;

        friend bool operator==(const number& lhs, const number& rhs) noexcept { return lhs.value == rhs.value; }
    };

    /// @ingroup StanzaValue
    /// @brief Variant storage used internally by Stanza::value
    using storage_t = std::variant<
        std::monostate,
        bool,
        number,
        string,
        array,
        object
    >;


    /// @ingroup StanzaValue
    /// @brief Dynamic, order-preserving JSON DOM type.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs a null JSON value using the given memory resource
        STANZA_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null JSON value; disambiguates explicit nulls
        STANZA_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a boolean JSON value
        STANZA_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a numeric JSON value from a double (no lexeme)
        STANZA_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a numeric JSON value from an integral type.
        ///
        /// @details
        /// The decimal digits of @p i are kept as the lexeme, so values above
        /// 2^53 survive a round trip through the decoder.
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource())
            : m_MemRes{ res } {
            if constexpr (std::is_signed_v<I>) m_Storage = make_number(static_cast<std::int64_t>(i), res);
            else m_Storage = make_number(static_cast<std::uint64_t>(i), res);
        }

        /// @brief Constructs a numeric JSON value from a parsed token
        STANZA_API value(number n, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string JSON value from a C string
        STANZA_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string JSON value from a string_view
        STANZA_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string JSON value from an existing Stanza::string
        STANZA_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an array JSON value from an existing array
        STANZA_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an object JSON value from an existing object
        STANZA_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep-copies @p other into @p other's allocator
        STANZA_API value(const value& other);

        /// @brief Steals allocator and storage from @p other
        STANZA_API value(value&& other) noexcept;

        STANZA_API value& operator=(const value& other);
        STANZA_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the kind of JSON value currently stored
        [[nodiscard]] STANZA_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @brief Returns the stored boolean
        /// @throws std::bad_variant_access if `is_bool()` is false
        [[nodiscard]] STANZA_API bool as_bool() const;

        /// @brief Returns the stored number as a double
        /// @throws std::bad_variant_access if `is_number()` is false
        [[nodiscard]] STANZA_API double as_number() const;

        /// @brief Returns the stored number token, including its lexeme
        /// @throws std::bad_variant_access if `is_number()` is false
        [[nodiscard]] STANZA_API const number& as_number_token() const;

        /// @brief Returns the stored string
        /// @throws std::bad_variant_access if `is_string()` is false
        [[nodiscard]] STANZA_API string&       as_string();
        [[nodiscard]] STANZA_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @brief Returns the stored array, replacing any other content with an
        ///        empty array first
        [[nodiscard]] STANZA_API array&       as_array();

        /// @brief Returns the stored array
        /// @throws std::bad_variant_access if `is_array()` is false
        [[nodiscard]] STANZA_API const array& as_array() const;

        /// @brief Returns the stored object, replacing any other content with an
        ///        empty object first
        [[nodiscard]] STANZA_API object&       as_object();

        /// @brief Returns the stored object
        /// @throws std::bad_variant_access if `is_object()` is false
        [[nodiscard]] STANZA_API const object& as_object() const;

        /// @brief Number of elements (arrays), members (objects), or 0
        [[nodiscard]] STANZA_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Accesses or creates an array element by index, growing the
        ///        array with nulls as needed
        STANZA_API value& operator[](size_t idx);

        /// @brief Accesses an array element by index; returns a shared null
        ///        value when out of bounds or not an array
        STANZA_API const value& operator[](size_t idx) const;

        /// @brief Accesses or appends an object member by name
        STANZA_API value& operator[](std::string_view key);

        /// @brief Finds a member by exact name; nullptr if absent or not an object
        STANZA_API const value* find(std::string_view key) const;

        /// @brief Returns the member named @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        STANZA_API const value& at(std::string_view key) const;

        /// @brief Structural equality; object member order is significant
        STANZA_API friend bool operator==(const value& lhs, const value& rhs);

        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        STANZA_API static number make_number(std::int64_t i, std::pmr::memory_resource* res);
        STANZA_API static number make_number(std::uint64_t i, std::pmr::memory_resource* res);
        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Stanza
