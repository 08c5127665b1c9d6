/// @file conjunctions.cpp
/// @brief New and full moon lookups around an instant.

#include "astro/conjunctions.hpp"

#include <cmath>

namespace hilal::astro
{

namespace
{

constexpr f64 kNewMoonDeg = 0.0;
constexpr f64 kFullMoonDeg = 180.0;
constexpr f64 kMonthSearchDays = 40.0;
constexpr f64 kNearestSearchDays = 20.0;

} // anonymous namespace

std::optional<f64> previous_conjunction(const Ephemeris& ephemeris, f64 jd)
{
    return ephemeris.find_moon_phase(kNewMoonDeg, jd, -kMonthSearchDays);
}

std::optional<f64> next_conjunction(const Ephemeris& ephemeris, f64 jd)
{
    return ephemeris.find_moon_phase(kNewMoonDeg, jd, kMonthSearchDays);
}

std::optional<f64> nearest_conjunction(const Ephemeris& ephemeris, f64 jd)
{
    const auto before = ephemeris.find_moon_phase(kNewMoonDeg, jd, -kNearestSearchDays);
    const auto after = ephemeris.find_moon_phase(kNewMoonDeg, jd, kNearestSearchDays);

    if (!before)
    {
        return after;
    }
    if (!after)
    {
        return before;
    }
    return (std::abs(jd - *before) < std::abs(*after - jd)) ? before : after;
}

std::optional<f64> next_full_moon(const Ephemeris& ephemeris, f64 jd)
{
    return ephemeris.find_moon_phase(kFullMoonDeg, jd, kMonthSearchDays);
}

} // namespace hilal::astro
