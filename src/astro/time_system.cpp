/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <cmath>

namespace hilal::astro
{

namespace
{

// -----------------------------------------------------------------
// Julian Day Number <-> Gregorian date (Fliegel & Van Flandern).
// Integer arithmetic, exact for all dates after 4801 BC.
// -----------------------------------------------------------------

i64 day_number_from_date(i32 year, i32 month, i32 day)
{
    const i64 a = (14 - month) / 12;
    const i64 y = static_cast<i64>(year) + 4800 - a;
    const i64 m = static_cast<i64>(month) + 12 * a - 3;

    return day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
}

CalendarDate date_from_day_number(i64 jdn)
{
    const i64 a = jdn + 32044;
    const i64 b = (4 * a + 3) / 146097;
    const i64 c = a - (146097 * b) / 4;
    const i64 d = (4 * c + 3) / 1461;
    const i64 e = c - (1461 * d) / 4;
    const i64 m = (5 * e + 2) / 153;

    return CalendarDate{
        .year  = static_cast<i32>(100 * b + d - 4800 + m / 10),
        .month = static_cast<i32>(m + 3 - 12 * (m / 10)),
        .day   = static_cast<i32>(e - (153 * m + 2) / 5 + 1),
    };
}

bool parse_int(std::string_view sv, i32& out)
{
    if (sv.empty())
    {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

} // anonymous namespace

// -----------------------------------------------------------------
// Julian Date: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Shift from noon-based to midnight-based, then split whole days from
    // seconds of day so that 23:59:59.9999 never leaks into second = 60.
    const f64 shifted = jd + 0.5;
    i64 day_number = static_cast<i64>(std::floor(shifted));
    f64 seconds = (shifted - static_cast<f64>(day_number)) * time_constants::kSecondsPerDay;

    if (seconds >= time_constants::kSecondsPerDay - 1e-6)
    {
        ++day_number;
        seconds = 0.0;
    }

    const CalendarDate date = date_from_day_number(day_number);
    const i32 hour = static_cast<i32>(seconds / 3600.0);
    const i32 minute = static_cast<i32>((seconds - hour * 3600.0) / 60.0);

    return DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = hour,
        .minute = minute,
        .second = seconds - hour * 3600.0 - minute * 60.0,
    };
}

// -----------------------------------------------------------------
// Calendar-day helpers
// -----------------------------------------------------------------

f64 TimeSystem::midnight_jd(const CalendarDate& date)
{
    return to_julian_date(DateTime{
        .year = date.year, .month = date.month, .day = date.day,
        .hour = 0, .minute = 0, .second = 0.0,
    });
}

CalendarDate TimeSystem::calendar_date(f64 jd)
{
    return date_from_day_number(static_cast<i64>(std::floor(jd + 0.5)));
}

CalendarDate TimeSystem::add_days(const CalendarDate& date, i32 days)
{
    return date_from_day_number(day_number_from_date(date.year, date.month, date.day) + days);
}

i32 TimeSystem::days_between(const CalendarDate& from, const CalendarDate& to)
{
    return static_cast<i32>(day_number_from_date(to.year, to.month, to.day)
                          - day_number_from_date(from.year, from.month, from.day));
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    const i32 next_year = (month == 12) ? year + 1 : year;
    const i32 next_month = (month == 12) ? 1 : month + 1;
    return static_cast<i32>(day_number_from_date(next_year, next_month, 1)
                          - day_number_from_date(year, month, 1));
}

// -----------------------------------------------------------------
// ΔT: Espenak & Meeus (NASA eclipse web site polynomials)
// -----------------------------------------------------------------

f64 TimeSystem::delta_t_seconds(f64 jd)
{
    const DateTime dt = from_julian_date(jd);
    const f64 y = static_cast<f64>(dt.year) + (static_cast<f64>(dt.month) - 0.5) / 12.0;

    if (y >= 2005.0 && y < 2050.0)
    {
        const f64 t = y - 2000.0;
        return 62.92 + 0.32217 * t + 0.005589 * t * t;
    }

    if (y >= 1986.0 && y < 2005.0)
    {
        const f64 t = y - 2000.0;
        return 63.86 + 0.3345 * t - 0.060374 * t * t
             + 0.0017275 * t * t * t
             + 0.000651814 * t * t * t * t
             + 0.00002373599 * t * t * t * t * t;
    }

    const f64 u = (y - 1820.0) / 100.0;
    if (y >= 2050.0 && y < 2150.0)
    {
        return -20.0 + 32.0 * u * u - 0.5628 * (2150.0 - y);
    }

    return -20.0 + 32.0 * u * u;
}

f64 TimeSystem::ut_to_tt(f64 jd_ut)
{
    return jd_ut + delta_t_seconds(jd_ut) * time_constants::kOneSecond;
}

// -----------------------------------------------------------------
// Current system time → Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    return astro_constants::kUnixEpochJd + total_seconds / time_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Formatting / parsing
// -----------------------------------------------------------------

std::string TimeSystem::format_iso(f64 jd)
{
    const f64 shifted = jd + 0.5;
    i64 day_number = static_cast<i64>(std::floor(shifted));
    i64 seconds = std::llround((shifted - static_cast<f64>(day_number)) * time_constants::kSecondsPerDay);
    if (seconds >= 86400)
    {
        ++day_number;
        seconds -= 86400;
    }

    const CalendarDate date = date_from_day_number(day_number);
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                       date.year, date.month, date.day,
                       seconds / 3600, (seconds / 60) % 60, seconds % 60);
}

std::string TimeSystem::format_date(const CalendarDate& date)
{
    return fmt::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day);
}

std::optional<CalendarDate> TimeSystem::parse_date(std::string_view text)
{
    // Expected layout: YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }

    CalendarDate date{};
    if (!parse_int(text.substr(0, 4), date.year) ||
        !parse_int(text.substr(5, 2), date.month) ||
        !parse_int(text.substr(8, 2), date.day))
    {
        return std::nullopt;
    }

    if (date.month < 1 || date.month > 12 ||
        date.day < 1 || date.day > days_in_month(date.year, date.month))
    {
        return std::nullopt;
    }

    return date;
}

} // namespace hilal::astro
