#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, calendar dates, ΔT.

#include "core/types.hpp"

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace hilal::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief A Gregorian calendar day with no time-of-day component.
    ///
    /// Used wherever the engine talks about "the evening of" a date or about
    /// the nights of a lunar month. Ordered chronologically.
    struct CalendarDate
    {
        i32 year;
        i32 month;
        i32 day;

        auto operator<=>(const CalendarDate&) const = default;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Instants are Julian Dates on the UT scale throughout the engine.
    /// Julian Date conversion follows Meeus (Astronomical Algorithms, Ch. 7).
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Julian Date of 00:00 UTC on the given calendar day.
        [[nodiscard]] static f64 midnight_jd(const CalendarDate& date);

        /// @brief UTC calendar day containing the given instant.
        [[nodiscard]] static CalendarDate calendar_date(f64 jd);

        /// @brief Shift a calendar date by a whole number of days (may be negative).
        [[nodiscard]] static CalendarDate add_days(const CalendarDate& date, i32 days);

        /// @brief Whole days from @p from to @p to (positive when @p to is later).
        [[nodiscard]] static i32 days_between(const CalendarDate& from, const CalendarDate& to);

        /// @brief Approximate ΔT = TT − UT in seconds.
        ///
        /// Espenak–Meeus polynomial for 2005–2050; outside that range the
        /// parabola of Morrison & Stephenson is used. Good to a few seconds
        /// over the centuries that matter for crescent prediction.
        [[nodiscard]] static f64 delta_t_seconds(f64 jd);

        /// @brief Convert a UT Julian Date to Terrestrial Time.
        [[nodiscard]] static f64 ut_to_tt(f64 jd_ut);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Format an instant as "YYYY-MM-DDTHH:MM:SSZ".
        [[nodiscard]] static std::string format_iso(f64 jd);

        /// @brief Format a calendar date as "YYYY-MM-DD".
        [[nodiscard]] static std::string format_date(const CalendarDate& date);

        /// @brief Parse "YYYY-MM-DD". Returns std::nullopt on malformed or impossible dates.
        [[nodiscard]] static std::optional<CalendarDate> parse_date(std::string_view text);

        /// @brief Number of days in a Gregorian month.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);
    };

} // namespace hilal::astro
