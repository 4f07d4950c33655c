#pragma once


/*
    ---------------------------------------
    Stanza::DateTime - ISO 8601 timestamps
    ---------------------------------------
    Calendar date plus time of day as written in a JSON string, with the
    zone designator it carried:

        2012-02-01                       unspecified, midnight
        2012-02-01T00:45:00.0000000      unspecified
        2012-02-01T00:45:00Z             utc
        2012-02-01T00:45:00.5+02:00      offset (+120 minutes)

    Fractions carry up to 9 digits; further digits are truncated. Equality is
    field-wise, so the same instant written with two different offsets
    compares unequal; compare `to_utc()` for instants.
*/

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "stanza/config.hpp"

namespace Stanza {

    /// @ingroup Stanza
    /// @brief Date and time of day with an optional UTC offset
    struct DateTime {
        /// @brief Zone designator the value was written with
        enum class zone : uint8_t {
            unspecified, ///< No designator
            utc,         ///< `Z`
            offset,      ///< `+hh:mm` / `-hh:mm`
        };

        std::chrono::year_month_day date{ std::chrono::year{ 1 }, std::chrono::month{ 1 }, std::chrono::day{ 1 } };
        std::chrono::nanoseconds time_of_day{};
        zone kind = zone::unspecified;
        std::int16_t offset_minutes = 0;

        /// @brief Parses an ISO 8601 date or date-time; `std::nullopt` if malformed
        [[nodiscard]] STANZA_API static std::optional<DateTime> parse_iso8601(std::string_view text);

        /// @brief The instant this value denotes; unspecified values are read as UTC
        [[nodiscard]] STANZA_API std::chrono::sys_time<std::chrono::nanoseconds> to_utc() const noexcept;

        /// @brief ISO 8601 text, `YYYY-MM-DDThh:mm:ss[.fffffffff][Z|±hh:mm]`
        [[nodiscard]] STANZA_API std::string to_string() const;

        friend bool operator==(const DateTime&, const DateTime&) = default;
    };

} // namespace Stanza
