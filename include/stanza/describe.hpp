#pragma once


/*
    ----------------------------------------------------
    Stanza::describe<T>() - Descriptors from C++ types
    ----------------------------------------------------
    Builds (once) and caches the TypeDescriptor of a C++ type, so a decode
    target can be named by type instead of assembled by hand:

        auto desc = Stanza::describe<std::vector<Person>>();

    -------------
    Builtin types
    -------------
    - `bool`, every integral type (by width and signedness), `float`,
      `double`
    - `std::string`, `Stanza::Decimal`, `Stanza::DateTime`
    - `std::optional<T>`: `T` accepting `null`
    - `std::vector<T>`, `std::list<T>`: list sequences
    - `std::deque<T>`: collection sequences
    - `std::array<T, N>`: array sequences of fixed length `N`
    - `std::map<std::string, T>`, `std::unordered_map<std::string, T>`

    ------------
    User structs
    ------------
    A struct becomes describable through an ADL hook next to it:

        struct Person {
            std::string name;
            int age = 0;
        };

        void describe(Stanza::type_tag<Person>, Stanza::ObjectBuilder<Person>& b) {
            b.named("Person");
            b.field("Name", &Person::name).required().length(1, 40);
            b.field("Age", &Person::age).range(0, 150);
        }

    Field options: `required()`, `default_value(model)`, `range(min, max)`,
    `length(min, max)` and `check(name, fn)`, where `fn` takes either the
    decoded `Model` or the field's C++ type and returns an error message when
    it rejects the value.

    Self-referencing structs are rejected with std::invalid_argument.
*/

/// @defgroup StanzaDescribe Describing C++ Types
/// @ingroup Stanza

#include <array>
#include <concepts>
#include <deque>
#include <list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "stanza/date_time.hpp"
#include "stanza/decimal.hpp"
#include "stanza/metadata.hpp"
#include "stanza/model.hpp"
#include "stanza/type_descriptor.hpp"

namespace Stanza {

    /// @ingroup StanzaDescribe
    /// @brief Tag carrying a type through ADL
    template<class T>
    struct type_tag {
        using type = T;
    };

    template<class T>
    class ObjectBuilder;

    template<class T>
    void bind_model(const Model& m, T& out);

    template<class T>
    [[nodiscard]] T model_cast(const Model& m);

    template<class T>
    [[nodiscard]] TypeDescriptorPtr describe();

    namespace detail {
        template<class T, template<class...> class Tmpl>
        struct is_specialization_of : std::false_type {};

        template<template<class...> class Tmpl, class... Args>
        struct is_specialization_of<Tmpl<Args...>, Tmpl> : std::true_type {};

        template<class T, template<class...> class Tmpl>
        inline constexpr bool is_specialization_of_v = is_specialization_of<T, Tmpl>::value;

        template<class T>
        struct is_std_array : std::false_type {};

        template<class T, std::size_t N>
        struct is_std_array<std::array<T, N>> : std::true_type {};

        template<class T>
        concept StringKeyedMap = (is_specialization_of_v<T, std::map> || is_specialization_of_v<T, std::unordered_map>)
            && std::same_as<typename T::key_type, std::string>;

        template<class T>
        concept ListLike = is_specialization_of_v<T, std::vector> || is_specialization_of_v<T, std::list>;

        template<class T>
        concept HasDescribeHook = requires(ObjectBuilder<T>& b) {
            { describe(type_tag<T>{}, b) } -> std::same_as<void>;
        };

        template<class>
        inline constexpr bool dependent_false = false;

        template<std::integral I>
        constexpr type_kind integral_kind() noexcept {
            if constexpr (std::is_signed_v<I>) {
                if constexpr (sizeof(I) == 1) return type_kind::int8;
                else if constexpr (sizeof(I) == 2) return type_kind::int16;
                else if constexpr (sizeof(I) == 4) return type_kind::int32;
                else return type_kind::int64;
            } else {
                if constexpr (sizeof(I) == 1) return type_kind::uint8;
                else if constexpr (sizeof(I) == 2) return type_kind::uint16;
                else if constexpr (sizeof(I) == 4) return type_kind::uint32;
                else return type_kind::uint64;
            }
        }

        // Types currently being built on this thread.
        inline std::vector<std::type_index>& describe_stack() {
            thread_local std::vector<std::type_index> stack;
            return stack;
        }

        struct DescribeGuard {
            explicit DescribeGuard(std::type_index t) {
                auto& stack = describe_stack();
                for (const auto& s : stack) {
                    if (s == t) throw std::invalid_argument(std::string{ "Self-referencing type cannot be described: " } + t.name());
                }
                stack.push_back(t);
            }
            ~DescribeGuard() { describe_stack().pop_back(); }
            DescribeGuard(const DescribeGuard&) = delete;
            DescribeGuard& operator=(const DescribeGuard&) = delete;
        };

        template<class T>
        TypeDescriptorPtr build_descriptor();
    } // namespace detail

    /// @ingroup StanzaDescribe
    /// @brief True for every type `describe<T>()` accepts
    template<class T>
    concept Describable = std::same_as<T, bool> || std::integral<T> || std::floating_point<T>
        || std::same_as<T, std::string> || std::same_as<T, Decimal> || std::same_as<T, DateTime>
        || detail::is_specialization_of_v<T, std::optional> || detail::ListLike<T>
        || detail::is_specialization_of_v<T, std::deque> || detail::is_std_array<T>::value
        || detail::StringKeyedMap<T> || detail::HasDescribeHook<T>;

    /// @ingroup StanzaDescribe
    /// @brief Fluent options of the field most recently added to an ObjectBuilder
    template<class T, class M>
    class FieldOptions {
    public:
        explicit FieldOptions(FieldDescriptor& field) : m_Field{ field } {}

        /// @brief The member must be present in the body
        FieldOptions& required(bool value = true) {
            m_Field.required = value;
            return *this;
        }

        /// @brief Value used when the member is absent
        FieldOptions& default_value(Model value) {
            m_Field.default_value = std::move(value);
            return *this;
        }

        FieldOptions& range(double min, double max) {
            m_Field.constraints.emplace_back(RangeConstraint{ min, max });
            return *this;
        }

        FieldOptions& length(std::size_t min, std::size_t max) {
            m_Field.constraints.emplace_back(LengthConstraint{ min, max });
            return *this;
        }

        /// @brief Custom rule; @p fn returns a message when it rejects the value
        template<class Fn>
        FieldOptions& check(std::string name, Fn fn) {
            if constexpr (std::is_invocable_v<Fn, const Model&>) {
                m_Field.constraints.emplace_back(CustomConstraint{ std::move(name), std::move(fn) });
            } else {
                m_Field.constraints.emplace_back(CustomConstraint{
                    std::move(name),
                    [fn = std::move(fn)](const Model& m) -> std::optional<std::string> { return fn(model_cast<M>(m)); } });
            }
            return *this;
        }

    private:
        FieldDescriptor& m_Field;
    };

    /// @ingroup StanzaDescribe
    /// @brief Collects the fields of struct `T` inside a `describe` hook
    template<class T>
    class ObjectBuilder {
    public:
        ObjectBuilder() = default;

        /// @brief Name used for `T` in error messages
        ObjectBuilder& named(std::string name) {
            m_Name = std::move(name);
            return *this;
        }

        /// @brief Adds field @p name bound to data member @p member
        template<Describable M>
        FieldOptions<T, M> field(std::string name, M T::* member) {
            FieldDescriptor f;
            f.name = std::move(name);
            f.type = describe<M>();
            f.assign = [member](void* obj, const Model& m) { bind_model(m, static_cast<T*>(obj)->*member); };
            m_Fields.push_back(std::move(f));
            return FieldOptions<T, M>{ m_Fields.back() };
        }

        [[nodiscard]] TypeDescriptorPtr build() && {
            return TypeDescriptor::object(std::move(m_Name), std::move(m_Fields));
        }

    private:
        std::string m_Name{ "object" };
        std::vector<FieldDescriptor> m_Fields;
    };

    /// @ingroup StanzaDescribe
    /// @brief Cached descriptor of `T`
    /// @throws std::invalid_argument if `T` refers to itself
    template<class T>
    TypeDescriptorPtr describe() {
        using U = std::remove_cvref_t<T>;
        return default_descriptor_cache().get_or_build(typeid(U), [] {
            detail::DescribeGuard guard{ typeid(U) };
            return detail::build_descriptor<U>();
        });
    }

    template<class T>
    TypeDescriptorPtr detail::build_descriptor() {
        if constexpr (std::same_as<T, bool>) {
            return TypeDescriptor::primitive(type_kind::boolean);
        } else if constexpr (std::integral<T>) {
            return TypeDescriptor::primitive(integral_kind<T>());
        } else if constexpr (std::floating_point<T>) {
            return TypeDescriptor::primitive(sizeof(T) == sizeof(float) ? type_kind::float32 : type_kind::float64);
        } else if constexpr (std::same_as<T, std::string>) {
            return TypeDescriptor::primitive(type_kind::string);
        } else if constexpr (std::same_as<T, Decimal>) {
            return TypeDescriptor::primitive(type_kind::decimal);
        } else if constexpr (std::same_as<T, DateTime>) {
            return TypeDescriptor::primitive(type_kind::date_time);
        } else if constexpr (is_specialization_of_v<T, std::optional>) {
            return TypeDescriptor::nullable(describe<typename T::value_type>());
        } else if constexpr (ListLike<T>) {
            return TypeDescriptor::sequence_of(describe<typename T::value_type>(), sequence_flavor::list);
        } else if constexpr (is_specialization_of_v<T, std::deque>) {
            return TypeDescriptor::sequence_of(describe<typename T::value_type>(), sequence_flavor::collection);
        } else if constexpr (is_std_array<T>::value) {
            return TypeDescriptor::sequence_of(describe<typename T::value_type>(), sequence_flavor::array, std::tuple_size_v<T>);
        } else if constexpr (StringKeyedMap<T>) {
            return TypeDescriptor::map_of(describe<typename T::mapped_type>());
        } else if constexpr (HasDescribeHook<T>) {
            ObjectBuilder<T> builder;
            describe(type_tag<T>{}, builder);
            return std::move(builder).build();
        } else {
            static_assert(dependent_false<T>, "Stanza::describe: type has no builtin description and no describe(type_tag<T>, ObjectBuilder<T>&) hook");
        }
    }

} // namespace Stanza

#include "stanza/binding.hpp"
