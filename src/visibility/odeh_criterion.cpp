/// @file odeh_criterion.cpp
/// @brief Implementation of the evening geometry and Odeh V-criterion.

#include "visibility/odeh_criterion.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <exception>

namespace hilal::visibility
{

using astro::Body;
using astro::Direction;

namespace
{

// Zone thresholds (Odeh 2006). Each boundary belongs to the higher zone.
constexpr f64 kEasilyVisibleMin = 5.65;
constexpr f64 kPerfectConditionsMin = 2.0;
constexpr f64 kOpticalAidMin = -0.96;

constexpr f64 kSunsetSearchDays = 1.0;
constexpr f64 kMoonsetSearchDays = 2.0;
constexpr f64 kNextSunriseSearchDays = 2.0;

// Best observation time sits 4/9 of the lag after sunset (Yallop)
constexpr f64 kBestTimeFraction = 4.0 / 9.0;

} // anonymous namespace

// -----------------------------------------------------------------
// Classification helpers
// -----------------------------------------------------------------

std::string_view classification_code(Classification classification)
{
    switch (classification)
    {
        case Classification::EasilyVisible:                 return "EV";
        case Classification::VisibleUnderPerfectConditions: return "VP";
        case Classification::VisibleWithOpticalAid:         return "VO";
        case Classification::NotVisible:                    return "NV";
        case Classification::Impossible:                    return "I";
        case Classification::Undetermined:                  return "U";
    }
    return "U";
}

std::string_view classification_name(Classification classification)
{
    switch (classification)
    {
        case Classification::EasilyVisible:                 return "Easily Visible";
        case Classification::VisibleUnderPerfectConditions: return "Visible Under Perfect Conditions";
        case Classification::VisibleWithOpticalAid:         return "Visible With Optical Aid";
        case Classification::NotVisible:                    return "Not Visible";
        case Classification::Impossible:                    return "Impossible";
        case Classification::Undetermined:                  return "Undetermined";
    }
    return "Undetermined";
}

bool is_visible(Classification classification)
{
    return classification == Classification::EasilyVisible
        || classification == Classification::VisibleUnderPerfectConditions
        || classification == Classification::VisibleWithOpticalAid;
}

f64 odeh_limit(f64 crescent_width_arcmin)
{
    const f64 w = crescent_width_arcmin;
    return -0.1018 * w * w * w + 0.7319 * w * w - 6.3226 * w + 7.1651;
}

Classification classify_v(f64 v_value)
{
    if (v_value >= kEasilyVisibleMin)
    {
        return Classification::EasilyVisible;
    }
    if (v_value >= kPerfectConditionsMin)
    {
        return Classification::VisibleUnderPerfectConditions;
    }
    if (v_value >= kOpticalAidMin)
    {
        return Classification::VisibleWithOpticalAid;
    }
    return Classification::NotVisible;
}

// -----------------------------------------------------------------
// VisibilityResult
// -----------------------------------------------------------------

std::string VisibilityResult::local_time(f64 jd) const
{
    std::string stamp = astro::TimeSystem::format_iso(jd + tz_hours / time_constants::kHoursPerDay);
    stamp.pop_back();  // drop the 'Z'
    return fmt::format("{}{:+03d}", stamp, tz_hours);
}

f64 local_midnight_jd(const astro::CalendarDate& date, i32 tz_hours)
{
    return astro::TimeSystem::midnight_jd(date) - tz_hours / time_constants::kHoursPerDay;
}

// -----------------------------------------------------------------
// classify_visibility
// -----------------------------------------------------------------

VisibilityResult classify_visibility(
    const astro::Ephemeris& ephemeris,
    const astro::Observer& observer,
    const astro::CalendarDate& date,
    std::optional<f64> conjunction)
{
    VisibilityResult result;
    result.observer = observer.normalized();
    result.date = date;
    result.tz_hours = astro::Coordinates::longitude_timezone_hours(result.observer.longitude_deg);
    result.conjunction = conjunction;

    try
    {
        const f64 local_noon = local_midnight_jd(date, result.tz_hours) + 0.5;

        const auto sunset = ephemeris.find_rise_set(
            Body::Sun, result.observer, Direction::Set, local_noon, kSunsetSearchDays);
        if (!sunset)
        {
            result.failure_reason = "No sunset found";
            return result;
        }
        result.sunset = *sunset;

        const auto moonset = ephemeris.find_rise_set(
            Body::Moon, result.observer, Direction::Set, result.sunset, kMoonsetSearchDays);
        if (!moonset)
        {
            result.failure_reason = "No moonset found";
            return result;
        }
        result.moonset = *moonset;
        result.lag_minutes = (result.moonset - result.sunset) * time_constants::kMinutesPerDay;

        if (result.lag_minutes <= 0.0)
        {
            result.classification = Classification::Impossible;
            result.failure_reason = "Moon sets before or at sunset";
            return result;
        }

        // A conjunction later this same night means there is no crescent yet
        if (conjunction && *conjunction > result.sunset)
        {
            const auto next_sunrise = ephemeris.find_rise_set(
                Body::Sun, result.observer, Direction::Rise, result.sunset, kNextSunriseSearchDays);
            if (!next_sunrise || *conjunction < *next_sunrise)
            {
                result.classification = Classification::Impossible;
                result.conjunction_triggered = true;
                result.failure_reason = "Conjunction occurs after sunset";
                return result;
            }
        }

        result.best_time = result.sunset
                         + kBestTimeFraction * result.lag_minutes / time_constants::kMinutesPerDay;

        const f64 moon_alt = ephemeris.topocentric_altitude(Body::Moon, result.observer, result.best_time);
        const f64 sun_alt = ephemeris.topocentric_altitude(Body::Sun, result.observer, result.best_time);
        result.arcv_deg = moon_alt - sun_alt;

        result.elongation_deg = ephemeris.elongation(result.best_time);
        const f64 moon_distance_km =
            ephemeris.geocentric_distance(Body::Moon, result.best_time) * astro_constants::kAuKm;
        result.moon_semi_diameter_arcmin =
            (astro_constants::kMoonRadiusKm / moon_distance_km) * astro_constants::kRadToDeg * 60.0;
        result.crescent_width_arcmin = result.moon_semi_diameter_arcmin
            * (1.0 - std::cos(result.elongation_deg * astro_constants::kDegToRad));

        const f64 v = result.arcv_deg - odeh_limit(result.crescent_width_arcmin);
        result.v_value = v;
        result.classification = classify_v(v);
    }
    catch (const std::exception& e)
    {
        HLL_CORE_WARN("Visibility at ({:.2f}, {:.2f}) failed: {}",
                      result.observer.latitude_deg, result.observer.longitude_deg, e.what());
        result.classification = Classification::Undetermined;
        result.v_value.reset();
        result.failure_reason = e.what();
    }

    return result;
}

} // namespace hilal::visibility
