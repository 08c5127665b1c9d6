/// @file hijri.cpp
/// @brief Tabular Hijri conversion.

#include "calendar/hijri.hpp"

#include <array>

namespace hilal::calendar
{

namespace
{

constexpr std::array<std::string_view, 12> kMonthNames = {
    "Muharram",
    "Safar",
    "Rabi al-Awwal",
    "Rabi al-Thani",
    "Jumada al-Awwal",
    "Jumada al-Thani",
    "Rajab",
    "Shaban",
    "Ramadan",
    "Shawwal",
    "Dhul-Qidah",
    "Dhul-Hijjah",
};

// Julian Day Number of a Gregorian date (Fliegel & Van Flandern)
i64 julian_day_number(const astro::CalendarDate& date)
{
    const i64 a = (14 - date.month) / 12;
    const i64 y = date.year + 4800 - a;
    const i64 m = date.month + 12 * a - 3;
    return date.day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
}

} // anonymous namespace

HijriDate gregorian_to_hijri(const astro::CalendarDate& date)
{
    // 1948440 is the JDN of 1 Muharram 1 AH; 10631 days make one 30-year cycle
    i64 l = julian_day_number(date) - 1948440 + 10632;
    const i64 n = (l - 1) / 10631;
    l = l - 10631 * n + 354;

    const i64 j = ((10985 - l) / 5316) * ((50 * l) / 17719)
                + (l / 5670) * ((43 * l) / 15238);
    l = l - ((30 - j) / 15) * ((17719 * j) / 50)
          - (j / 16) * ((15238 * j) / 43) + 29;

    const i64 month = (24 * l) / 709;
    const i64 day = l - (709 * month) / 24;
    const i64 year = 30 * n + j - 30;

    return HijriDate{
        .year  = static_cast<i32>(year),
        .month = static_cast<i32>(month),
        .day   = static_cast<i32>(day),
    };
}

std::string_view hijri_month_name(i32 month)
{
    if (month < 1 || month > 12)
    {
        return "Unknown";
    }
    return kMonthNames[static_cast<usize>(month - 1)];
}

} // namespace hilal::calendar
