#pragma once


/*
    --------------------------------------------------
    Stanza binding - decoded Models into C++ objects
    --------------------------------------------------
    `bind_model(model, out)` writes a Model into an object of the C++ type
    it was decoded for, i.e. the type whose `describe<T>()` descriptor the
    decoder used. Every sequence flavour lands in whatever container `T`
    names, so one decoded sequence binds equally into a vector, a list, a
    deque or an array.

        Person p = Stanza::model_cast<Person>(result.model());

    - Numeric Models bind into any arithmetic type with a `static_cast`
    - `null` binds as a value-initialized leaf, an empty container, or a
      disengaged optional
    - A fixed-size `std::array` takes as many elements as it has room for
    - Described structs are filled field by field through the setters the
      `describe` hook recorded

    A Model that does not have the shape of `T` is a programming error and
    throws std::bad_variant_access; data errors have already been reported
    by the decoder at that point.
*/

/// @defgroup StanzaBinding Binding
/// @ingroup Stanza

#include <cstddef>
#include <type_traits>
#include <variant>

#include "stanza/describe.hpp"
#include "stanza/model.hpp"

namespace Stanza {

    /// @ingroup StanzaBinding
    /// @brief Writes @p m into @p out
    /// @throws std::bad_variant_access if @p m does not have the shape of `T`
    template<class T>
    void bind_model(const Model& m, T& out) {
        if constexpr (detail::is_specialization_of_v<T, std::optional>) {
            if (m.is_null()) {
                out.reset();
                return;
            }
            typename T::value_type inner{};
            bind_model(m, inner);
            out = std::move(inner);
        } else if constexpr (std::same_as<T, bool>) {
            out = m.is_null() ? false : m.as_bool();
        } else if constexpr (std::integral<T> || std::floating_point<T>) {
            switch (m.kind()) {
            case model_kind::null: out = T{}; break;
            case model_kind::unsigned_integer: out = static_cast<T>(m.as_uint64()); break;
            case model_kind::floating: out = static_cast<T>(m.as_double()); break;
            default: out = static_cast<T>(m.as_int64()); break;
            }
        } else if constexpr (std::same_as<T, std::string> || std::same_as<T, Decimal> || std::same_as<T, DateTime>) {
            if (m.is_null()) out = T{};
            else if constexpr (std::same_as<T, std::string>) out = m.as_string();
            else if constexpr (std::same_as<T, Decimal>) out = m.as_decimal();
            else out = m.as_date_time();
        } else if constexpr (detail::ListLike<T> || detail::is_specialization_of_v<T, std::deque>) {
            out.clear();
            if (m.is_null()) return;
            for (const auto& e : m.as_sequence()) {
                out.emplace_back();
                bind_model(e, out.back());
            }
        } else if constexpr (detail::is_std_array<T>::value) {
            out = T{};
            if (m.is_null()) return;
            const auto& seq = m.as_sequence();
            for (std::size_t i = 0; i < out.size() && i < seq.size(); i++) bind_model(seq[i], out[i]);
        } else if constexpr (detail::StringKeyedMap<T>) {
            out.clear();
            if (m.is_null()) return;
            for (const auto& [key, v] : m.as_map().entries) bind_model(v, out[key]);
        } else if constexpr (detail::HasDescribeHook<T>) {
            out = T{};
            if (m.is_null()) return;
            const auto descriptor = describe<T>();
            const auto& fields = m.as_object().fields;
            for (const auto& f : descriptor->fields()) {
                if (!f.assign) continue;
                for (const auto& [name, v] : fields) {
                    if (name == f.name) {
                        f.assign(&out, v);
                        break;
                    }
                }
            }
        } else {
            static_assert(detail::dependent_false<T>, "Stanza::bind_model: type is not describable");
        }
    }

    /// @ingroup StanzaBinding
    /// @brief Value-initializes a `T` and binds @p m into it
    template<class T>
    T model_cast(const Model& m) {
        T out{};
        bind_model(m, out);
        return out;
    }

} // namespace Stanza
