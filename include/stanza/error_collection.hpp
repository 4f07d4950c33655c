#pragma once


/*
    -----------------------------------------------------
    Stanza::ErrorCollection - Path-addressed model errors
    -----------------------------------------------------
    Accumulates the data errors of one or more decodes, keyed by the rendered
    model path of the offending value. Errors are never thrown; a decode
    records them here and carries on with the next sibling.

    ---------
    Structure
    ---------
    - Keys keep the order in which they were first written
    - Each key holds its errors in the order they were added
    - `ModelError` carries a `code`, the human-readable `msg` and, for
      malformed bodies, the `ParseError` with line/column information

    ------------
    Error budget
    ------------
    - `max_allowed_errors()` defaults to unbounded
    - Once adding an error would bring the count to `max_allowed_errors() - 1`,
      the add is refused and one `too_many_errors` error is written under the
      root key `""` instead. That error counts towards the budget and is
      written once; every later add is refused silently
    - Errors added by the caller before a decode count as well

    -------------
    Thread-Safety
    -------------
    None. A collection belongs to the request that fills it.
*/

/// @defgroup StanzaErrors Model Errors
/// @ingroup Stanza
/// @brief Error accumulation keyed by model path

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/error.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaErrors
    /// @brief A single data error recorded against a model path
    struct ModelError {
        /// @brief Classification of a model error
        ///
        /// @details
        /// - `invalid_json`: the body is not well-formed JSON (root key)
        /// - `conversion_failed`: a token of the wrong shape for the target
        /// - `value_out_of_range`: a number outside the target's range
        /// - `null_not_allowed`: `null` for a non-nullable target
        /// - `length_mismatch`: wrong element count for a fixed-length sequence
        /// - `required_member_missing`: a required member is absent
        /// - `validation_failed`: a field constraint rejected the value
        /// - `unsupported_content_type`: the body's charset cannot be read
        /// - `too_many_errors`: the error budget has been used up (root key)
        /// - `custom`: added by the caller
        enum class code : uint8_t {
            invalid_json,
            conversion_failed,
            value_out_of_range,
            null_not_allowed,
            length_mismatch,
            required_member_missing,
            validation_failed,
            unsupported_content_type,
            too_many_errors,
            custom,
        };

        code errc{ code::custom };
        std::string msg{};
        std::optional<ParseError> parse_error{};

        friend bool operator==(const ModelError& lhs, const ModelError& rhs) noexcept {
            return lhs.errc == rhs.errc && lhs.msg == rhs.msg;
        }
    };

    /// @ingroup StanzaErrors
    /// @brief Returns the enumerator name of @p c (e.g. `"value_out_of_range"`)
    [[nodiscard]] STANZA_API std::string_view to_string(ModelError::code c) noexcept;

    /// @ingroup StanzaErrors
    /// @brief Insertion-ordered map from model path to the errors recorded there
    class ErrorCollection {
    public:
        /// @brief All errors recorded under one key
        struct Entry {
            std::string key;
            std::vector<ModelError> errors;
        };

        static constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

        ErrorCollection() = default;

        /// @brief Records @p error under @p key, subject to the error budget
        /// @returns `false` when the budget refused the error
        STANZA_API bool try_add(std::string_view key, ModelError error);

        /// @brief Records a `custom` error with message @p msg under @p key
        STANZA_API bool try_add(std::string_view key, std::string_view msg);

        /// @brief Sets the error budget
        /// @throws std::invalid_argument if @p max is 0
        STANZA_API void set_max_allowed_errors(std::size_t max);

        [[nodiscard]] std::size_t max_allowed_errors() const noexcept { return m_MaxAllowed; }

        /// @brief True once the `too_many_errors` error has been written
        [[nodiscard]] bool has_reached_max_errors() const noexcept { return m_HasReachedMax; }

        /// @brief Number of errors recorded, the budget error included
        [[nodiscard]] std::size_t error_count() const noexcept { return m_Count; }

        [[nodiscard]] bool empty() const noexcept { return m_Entries.empty(); }
        [[nodiscard]] bool is_valid() const noexcept { return m_Count == 0; }

        [[nodiscard]] STANZA_API bool contains(std::string_view key) const;

        /// @brief Errors recorded under @p key, empty when there are none
        [[nodiscard]] STANZA_API const std::vector<ModelError>& errors(std::string_view key) const;

        /// @brief Keys in first-write order
        [[nodiscard]] STANZA_API std::vector<std::string> keys() const;

        [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return m_Entries; }

        /// @brief Removes every error and resets the budget state, keeping the budget
        STANZA_API void clear() noexcept;

    private:
        std::vector<Entry> m_Entries;
        std::map<std::string, std::size_t, std::less<>> m_Index;
        std::size_t m_Count = 0;
        std::size_t m_MaxAllowed = unbounded;
        bool m_HasReachedMax = false;

        void append(std::string_view key, ModelError error);
    };

    /// @ingroup StanzaErrors
    /// @brief Renders @p errors as `{ "path": ["message", ...], ... }`
    [[nodiscard]] STANZA_API value to_value(const ErrorCollection& errors,
                                            std::pmr::memory_resource* res = std::pmr::get_default_resource());

} // namespace Stanza
