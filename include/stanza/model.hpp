#pragma once


/*
    -------------------------------
    Stanza::Model - Decoded values
    -------------------------------
    A `Model` is what the decoder produces from a body: a dynamic value whose
    shape follows the `TypeDescriptor` it was decoded against rather than the
    JSON text it came from.

        - null
        - boolean
        - signed / unsigned 64-bit integer (every integral leaf width)
        - floating (float32 and float64 leaves)
        - Decimal
        - string
        - DateTime
        - sequence (every sequence flavour)
        - map (string keys, in document order)
        - object (the declared fields, in declaration order)

    Maps and objects share a member list but are distinct alternatives: an
    object always holds exactly its declared fields, a map holds whatever
    the body contained.

    `bind_model` (binding.hpp) turns a Model into a concrete C++ value;
    `to_value` renders it back as a JSON DOM.
*/

/// @defgroup StanzaModel Decoded Model
/// @ingroup Stanza

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/date_time.hpp"
#include "stanza/decimal.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaModel
    /// @brief Alternatives a Model can hold
    enum class model_kind : uint8_t {
        null,
        boolean,
        signed_integer,
        unsigned_integer,
        floating,
        decimal,
        string,
        date_time,
        sequence,
        map,
        object,
    };

    /// @ingroup StanzaModel
    /// @brief Dynamic decoded value
    class Model {
    public:
        using sequence = std::vector<Model>;
        using member_list = std::vector<std::pair<std::string, Model>>;

        /// @brief String-keyed entries of a map target
        struct map {
            member_list entries;
            friend bool operator==(const map&, const map&) = default;
        };

        /// @brief Declared fields of an object target
        struct object {
            member_list fields;

            /// @brief Field named exactly @p name, or nullptr
            [[nodiscard]] STANZA_API const Model* find(std::string_view name) const noexcept;
            friend bool operator==(const object&, const object&) = default;
        };

        using storage_t = std::variant<
            std::monostate,
            bool,
            std::int64_t,
            std::uint64_t,
            double,
            Decimal,
            std::string,
            DateTime,
            sequence,
            map,
            object
        >;

        Model() noexcept = default;
        Model(std::nullptr_t) noexcept {}
        Model(bool b) noexcept : m_Storage{ std::in_place_type<bool>, b } {}

        template<std::integral I>
            requires (!std::same_as<I, bool>)
        Model(I i) noexcept {
            if constexpr (std::is_signed_v<I>) m_Storage.emplace<std::int64_t>(i);
            else m_Storage.emplace<std::uint64_t>(i);
        }

        template<std::floating_point F>
        Model(F f) noexcept : m_Storage{ std::in_place_type<double>, static_cast<double>(f) } {}

        Model(Decimal d) noexcept : m_Storage{ std::in_place_type<Decimal>, d } {}
        Model(DateTime dt) noexcept : m_Storage{ std::in_place_type<DateTime>, dt } {}
        Model(std::string s) : m_Storage{ std::in_place_type<std::string>, std::move(s) } {}
        Model(std::string_view s) : m_Storage{ std::in_place_type<std::string>, s } {}
        Model(const char* s) : m_Storage{ std::in_place_type<std::string>, s } {}
        Model(sequence s) : m_Storage{ std::in_place_type<sequence>, std::move(s) } {}
        Model(map m) : m_Storage{ std::in_place_type<map>, std::move(m) } {}
        Model(object o) : m_Storage{ std::in_place_type<object>, std::move(o) } {}

        [[nodiscard]] model_kind kind() const noexcept { return static_cast<model_kind>(m_Storage.index()); }
        [[nodiscard]] bool is_null() const noexcept { return kind() == model_kind::null; }

        /// @name Accessors
        /// Each throws std::bad_variant_access when the Model holds another alternative.
        /// @{
        [[nodiscard]] bool as_bool() const { return std::get<bool>(m_Storage); }
        [[nodiscard]] std::int64_t as_int64() const { return std::get<std::int64_t>(m_Storage); }
        [[nodiscard]] std::uint64_t as_uint64() const { return std::get<std::uint64_t>(m_Storage); }
        [[nodiscard]] double as_double() const { return std::get<double>(m_Storage); }
        [[nodiscard]] const Decimal& as_decimal() const { return std::get<Decimal>(m_Storage); }
        [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_Storage); }
        [[nodiscard]] const DateTime& as_date_time() const { return std::get<DateTime>(m_Storage); }
        [[nodiscard]] const sequence& as_sequence() const { return std::get<sequence>(m_Storage); }
        [[nodiscard]] sequence& as_sequence() { return std::get<sequence>(m_Storage); }
        [[nodiscard]] const map& as_map() const { return std::get<map>(m_Storage); }
        [[nodiscard]] map& as_map() { return std::get<map>(m_Storage); }
        [[nodiscard]] const object& as_object() const { return std::get<object>(m_Storage); }
        [[nodiscard]] object& as_object() { return std::get<object>(m_Storage); }
        /// @}

        /// @brief Field of an object or entry of a map named exactly @p name
        /// @throws std::out_of_range if there is none or this is neither
        [[nodiscard]] STANZA_API const Model& at(std::string_view name) const;

        /// @brief Element @p idx of a sequence
        /// @throws std::out_of_range if out of bounds or not a sequence
        [[nodiscard]] STANZA_API const Model& at(std::size_t idx) const;

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        friend bool operator==(const Model&, const Model&) = default;

    private:
        storage_t m_Storage{};
    };

    /// @ingroup StanzaModel
    /// @brief Enumerator name of @p k
    [[nodiscard]] STANZA_API std::string_view to_string(model_kind k) noexcept;

    /// @ingroup StanzaModel
    /// @brief Renders @p m as a JSON DOM
    ///
    /// @details
    /// Integers keep their exact digits, decimals are written in plain
    /// notation with their scale, date-times become ISO 8601 strings.
    [[nodiscard]] STANZA_API value to_value(const Model& m, std::pmr::memory_resource* res = std::pmr::get_default_resource());

} // namespace Stanza
