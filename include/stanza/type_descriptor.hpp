#pragma once


/*
    ---------------------------------------------------
    Stanza::TypeDescriptor - Shapes the decoder targets
    ---------------------------------------------------
    A TypeDescriptor tells the decoder what a body is supposed to look like.
    It is one of

        - a primitive leaf (boolean, 8..64-bit integers, float32/64, decimal,
          string, date-time)
        - a sequence of an element type, tagged with the container flavour
          it binds to and an optional fixed length
        - a map from string keys to a value type
        - an object with named fields

    Descriptors are immutable once built and shared through
    `TypeDescriptorPtr`. They are normally produced by `describe<T>()`
    (describe.hpp) and cached per C++ type, but they can be assembled by hand
    with the static factories below.

    ---------
    Nullness
    ---------
    Strings, sequences, maps and objects accept `null` by default; numeric,
    boolean, decimal and date-time leaves do not unless wrapped with
    `TypeDescriptor::nullable`. `nullable(d, false)` turns the default around
    for a composite.

    ------
    Fields
    ------
    Every object field records whether it is required, an optional default
    Model used when the member is absent, the validation constraints checked
    after decoding, and the setter `bind_model` uses to write it into a C++
    object. Field lookup is exact first and ASCII case-insensitive second;
    both tables are built when the descriptor is.

    Self-referencing types cannot be described.
*/

/// @defgroup StanzaTypes Type Descriptors
/// @ingroup Stanza
/// @brief Runtime description of decode targets

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/model.hpp"

namespace Stanza {

    /// @ingroup StanzaTypes
    enum class type_kind : uint8_t {
        boolean,
        int8,
        uint8,
        int16,
        uint16,
        int32,
        uint32,
        int64,
        uint64,
        float32,
        float64,
        decimal,
        string,
        date_time,
        sequence,
        map,
        object,
    };

    /// @ingroup StanzaTypes
    /// @brief Container a sequence binds to; decoding treats all of them alike
    enum class sequence_flavor : uint8_t {
        array,      ///< fixed or runtime-sized array
        list,       ///< growable list (`std::vector`, `std::list`)
        collection, ///< generic collection (`std::deque`)
        enumerable, ///< read-only iteration
    };

    /// @ingroup StanzaTypes
    [[nodiscard]] STANZA_API std::string_view to_string(type_kind k) noexcept;

    /// @ingroup StanzaTypes
    /// @brief Inclusive numeric bounds for a numeric leaf
    struct RangeConstraint {
        double min;
        double max;
    };

    /// @ingroup StanzaTypes
    /// @brief Inclusive length bounds; code points for strings, elements for sequences
    struct LengthConstraint {
        std::size_t min;
        std::size_t max;
    };

    /// @ingroup StanzaTypes
    /// @brief Named predicate; returns an error message when the value is rejected
    struct CustomConstraint {
        std::string name;
        std::function<std::optional<std::string>(const Model&)> check;
    };

    using Constraint = std::variant<RangeConstraint, LengthConstraint, CustomConstraint>;

    class TypeDescriptor;
    using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

    /// @ingroup StanzaTypes
    /// @brief One named field of an object descriptor
    struct FieldDescriptor {
        std::string name;
        TypeDescriptorPtr type;
        bool required = false;
        std::optional<Model> default_value{};
        std::vector<Constraint> constraints{};

        /// @brief Writes a decoded Model into the field of a C++ object (`void*` is the object)
        std::function<void(void*, const Model&)> assign{};
    };

    /// @ingroup StanzaTypes
    /// @brief Immutable description of a decode target
    class TypeDescriptor {
        struct private_tag {
            explicit private_tag() = default;
        };

    public:
        /// @brief Use the static factories; the tag keeps construction inside the class
        explicit TypeDescriptor(private_tag) {}
        TypeDescriptor(private_tag, const TypeDescriptor& other) : TypeDescriptor{ other } {}

        /// @brief Leaf of kind @p k
        /// @throws std::invalid_argument for sequence, map and object kinds
        [[nodiscard]] STANZA_API static TypeDescriptorPtr primitive(type_kind k);

        /// @throws std::invalid_argument if @p element is null
        [[nodiscard]] STANZA_API static TypeDescriptorPtr sequence_of(TypeDescriptorPtr element,
                                                                      sequence_flavor flavor = sequence_flavor::list,
                                                                      std::optional<std::size_t> fixed_length = std::nullopt);

        /// @throws std::invalid_argument if @p element is null
        [[nodiscard]] STANZA_API static TypeDescriptorPtr map_of(TypeDescriptorPtr element);

        /// @throws std::invalid_argument on a null field type or a duplicate field name
        [[nodiscard]] STANZA_API static TypeDescriptorPtr object(std::string name, std::vector<FieldDescriptor> fields);

        /// @brief Copy of @p inner that accepts `null` (or, with @p accepts_null false, rejects it)
        [[nodiscard]] STANZA_API static TypeDescriptorPtr nullable(const TypeDescriptorPtr& inner, bool accepts_null = true);

        [[nodiscard]] type_kind kind() const noexcept { return m_Kind; }
        [[nodiscard]] bool is_nullable() const noexcept { return m_Nullable; }
        [[nodiscard]] bool is_integral() const noexcept { return m_Kind >= type_kind::int8 && m_Kind <= type_kind::uint64; }

        /// @brief Name used in error messages (`int16`, `Person`)
        [[nodiscard]] const std::string& name() const noexcept { return m_Name; }

        /// @brief Element type of a sequence or value type of a map; null otherwise
        [[nodiscard]] const TypeDescriptorPtr& element() const noexcept { return m_Element; }
        [[nodiscard]] sequence_flavor flavor() const noexcept { return m_Flavor; }
        [[nodiscard]] std::optional<std::size_t> fixed_length() const noexcept { return m_FixedLength; }

        [[nodiscard]] std::span<const FieldDescriptor> fields() const noexcept { return m_Fields; }

        /// @brief Field named @p name, matched exactly, then ASCII case-insensitively
        [[nodiscard]] STANZA_API const FieldDescriptor* find_field(std::string_view name) const;

        /// @brief Value of this type when nothing was decoded
        ///
        /// @details
        /// Null for nullable types; zero, `false`, empty, or the
        /// field defaults of an object otherwise.
        [[nodiscard]] STANZA_API Model default_model() const;

    private:
        struct string_hash {
            using is_transparent = void;
            std::size_t operator()(std::string_view s) const noexcept { return std::hash<std::string_view>{}(s); }
        };
        using field_index = std::unordered_map<std::string, std::size_t, string_hash, std::equal_to<>>;

        type_kind m_Kind = type_kind::object;
        bool m_Nullable = false;
        std::string m_Name;
        TypeDescriptorPtr m_Element;
        sequence_flavor m_Flavor = sequence_flavor::list;
        std::optional<std::size_t> m_FixedLength;
        std::vector<FieldDescriptor> m_Fields;
        field_index m_ExactIndex;
        field_index m_FoldedIndex;

        TypeDescriptor(const TypeDescriptor&) = default;
    };

} // namespace Stanza
