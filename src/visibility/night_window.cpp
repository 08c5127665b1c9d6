/// @file night_window.cpp
/// @brief Implementation of the night window with its polar fallbacks.

#include "visibility/night_window.hpp"

#include "core/logger.hpp"
#include "visibility/odeh_criterion.hpp"

#include <exception>

namespace hilal::visibility
{

using astro::Body;
using astro::Direction;

namespace
{

constexpr f64 kAstronomicalTwilightDeg = -18.0;
constexpr f64 kSunsetSearchDays = 1.0;
constexpr f64 kTwilightSearchDays = 12.0 * time_constants::kOneHour;
constexpr f64 kSunriseSearchDays = 1.0;
constexpr f64 kMaxPlausibleNightHours = 20.0;
constexpr f64 kSyntheticNightDays = 12.0 * time_constants::kOneHour;

} // anonymous namespace

std::optional<NightWindow> compute_night_window(
    const astro::Ephemeris& ephemeris,
    const astro::Observer& observer,
    const astro::CalendarDate& date,
    std::optional<f64> /*conjunction*/,
    std::optional<f64> known_sunset)
{
    const astro::Observer normalized = observer.normalized();

    try
    {
        f64 sunset = 0.0;
        if (known_sunset)
        {
            sunset = *known_sunset;
        }
        else
        {
            const i32 tz_hours = astro::Coordinates::longitude_timezone_hours(normalized.longitude_deg);
            const f64 local_noon = local_midnight_jd(date, tz_hours) + 0.5;
            const auto found = ephemeris.find_rise_set(
                Body::Sun, normalized, Direction::Set, local_noon, kSunsetSearchDays);
            if (!found)
            {
                return std::nullopt;
            }
            sunset = *found;
        }

        const auto sunrise = ephemeris.find_rise_set(
            Body::Sun, normalized, Direction::Rise, sunset, kSunriseSearchDays);

        // A −18° crossing after the next sunrise belongs to the following night
        const auto twilight_end = ephemeris.find_altitude(
            Body::Sun, normalized, Direction::Set, kAstronomicalTwilightDeg, sunset, kTwilightSearchDays);
        if (twilight_end && !(sunrise && *twilight_end > *sunrise))
        {
            return NightWindow{
                .night_start = sunset,
                .night_end   = *twilight_end,
                .source      = NightEndSource::AstronomicalTwilight,
            };
        }

        if (!sunrise)
        {
            return std::nullopt;
        }

        const f64 night_hours = (*sunrise - sunset) * time_constants::kHoursPerDay;
        if (night_hours > kMaxPlausibleNightHours)
        {
            HLL_CORE_WARN("Unusually long night at ({:.2f}, {:.2f}): {:.2f} hours",
                          normalized.latitude_deg, normalized.longitude_deg, night_hours);
            return NightWindow{
                .night_start = sunset,
                .night_end   = sunset + kSyntheticNightDays,
                .source      = NightEndSource::Synthetic,
                .approximate = true,
            };
        }

        if (*sunrise <= sunset)
        {
            return std::nullopt;
        }

        return NightWindow{
            .night_start = sunset,
            .night_end   = *sunrise,
            .source      = NightEndSource::Sunrise,
        };
    }
    catch (const std::exception& e)
    {
        HLL_CORE_WARN("Night window at ({:.2f}, {:.2f}) failed: {}",
                      normalized.latitude_deg, normalized.longitude_deg, e.what());
        return std::nullopt;
    }
}

} // namespace hilal::visibility
