#pragma once


/*
    ----------------------------------------
    Stanza::Decimal - Exact base-10 numbers
    ----------------------------------------
    Fixed-point decimal used for monetary and other base-10 fields whose JSON
    text must not round-trip through binary floating point.

    Representation
        - value = units / 10^scale
        - `units` is a signed 64-bit coefficient, `scale` is 0..18
        - The scale a number was written with is kept (`1.50` has scale 2)
          and only matters for `to_string`; equality compares values

    Parsing
        - `Decimal::parse` accepts a JSON number lexeme (`-12.5`, `1e3`,
          `2.5E-4`)
        - Digits beyond 18 fractional places are rounded half away from zero
        - Values whose coefficient does not fit in 64 bits yield
          `std::errc::result_out_of_range`; any other text yields
          `std::errc::invalid_argument`
*/

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "stanza/config.hpp"

namespace Stanza {

    /// @ingroup Stanza
    /// @brief Signed fixed-point decimal with up to 18 fractional digits
    class Decimal {
    public:
        static constexpr std::uint8_t max_scale = 18;

        constexpr Decimal() noexcept = default;

        /// @brief Builds `units / 10^scale`
        /// @throws std::invalid_argument if @p scale exceeds `max_scale`
        STANZA_API Decimal(std::int64_t units, std::uint8_t scale);

        /// @brief Parses a JSON number lexeme
        [[nodiscard]] STANZA_API static std::expected<Decimal, std::errc> parse(std::string_view text);

        [[nodiscard]] constexpr std::int64_t units() const noexcept { return m_Units; }
        [[nodiscard]] constexpr std::uint8_t scale() const noexcept { return m_Scale; }

        /// @brief Same value with trailing fractional zeros removed
        [[nodiscard]] STANZA_API Decimal normalized() const noexcept;

        [[nodiscard]] STANZA_API double to_double() const noexcept;

        /// @brief Plain notation with exactly `scale()` fractional digits
        [[nodiscard]] STANZA_API std::string to_string() const;

        STANZA_API friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept;

    private:
        std::int64_t m_Units = 0;
        std::uint8_t m_Scale = 0;
    };

} // namespace Stanza
