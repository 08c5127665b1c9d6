#pragma once

/// @file hijri.hpp
/// @brief Arithmetic (tabular) Islamic calendar conversion and month names.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <string_view>

namespace hilal::calendar
{
    /// @brief A date in the tabular Islamic calendar. Month in [1, 12].
    struct HijriDate
    {
        i32 year;
        i32 month;
        i32 day;

        bool operator==(const HijriDate&) const = default;
    };

    /// @brief Gregorian → tabular Hijri through the Julian Day Number.
    ///
    /// Uses the 30-year cycle with 11 leap years (Kuwaiti algorithm). It can
    /// differ by a day or two from observation-based calendars; the engine
    /// only uses it to name a month from a date near its middle.
    [[nodiscard]] HijriDate gregorian_to_hijri(const astro::CalendarDate& date);

    /// @brief English transliteration of a Hijri month (1 = Muharram). "Unknown" when out of range.
    [[nodiscard]] std::string_view hijri_month_name(i32 month);

} // namespace hilal::calendar
