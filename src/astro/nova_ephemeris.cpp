/// @file nova_ephemeris.cpp
/// @brief Implementation of the libnova-backed Sun/Moon ephemeris and its event searches.

#include "astro/nova_ephemeris.hpp"

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <libnova/earth.h>
#include <libnova/lunar.h>
#include <libnova/parallax.h>
#include <libnova/precession.h>
#include <libnova/rise_set.h>
#include <libnova/solar.h>
#include <libnova/transform.h>

#include <cmath>

namespace hilal::astro
{

namespace
{

using astro_constants::kRadToDeg;

// Full ELP2000-82B series
constexpr f64 kLunarSeriesPrecision = 0.0;

// Observer on the geoid
constexpr f64 kObserverHeightM = 0.0;

ln_lnlat_posn to_site(const Observer& observer)
{
    const Observer normalized = observer.normalized();
    return ln_lnlat_posn{.lng = normalized.longitude_deg, .lat = normalized.latitude_deg};
}

// -----------------------------------------------------------------
// Positions of date
//
// libnova's lunar series is referred to the mean ecliptic and equinox of
// J2000; it is precessed to date so that Moon and Sun share one frame.
// -----------------------------------------------------------------

void lunar_equatorial_of_date(double jd, ln_equ_posn* position)
{
    ln_lnlat_posn ecliptic_j2000{};
    ln_get_lunar_ecl_coords(jd, &ecliptic_j2000, kLunarSeriesPrecision);

    ln_equ_posn mean_j2000{};
    ln_get_equ_from_ecl(&ecliptic_j2000, astro_constants::kJ2000, &mean_j2000);
    ln_get_equ_prec(&mean_j2000, jd, position);
}

ln_equ_posn equatorial_of_date(Body body, f64 jd_tt)
{
    ln_equ_posn position{};
    if (body == Body::Sun)
    {
        ln_get_solar_equ_coords(jd_tt, &position);
    }
    else
    {
        lunar_equatorial_of_date(jd_tt, &position);
    }
    return position;
}

f64 distance_km_at(Body body, f64 jd_tt)
{
    return (body == Body::Sun) ? ln_get_earth_solar_dist(jd_tt) * astro_constants::kAuKm
                               : ln_get_lunar_earth_dist(jd_tt);
}

// Wrap an angle difference into (−180, 180]
f64 signed_degrees(f64 angle_deg)
{
    f64 wrapped = Coordinates::normalize_degrees(angle_deg);
    if (wrapped > 180.0)
    {
        wrapped -= 360.0;
    }
    return wrapped;
}

// -----------------------------------------------------------------
// Next event search
//
// libnova solves rise, transit and set for the day containing its JD
// argument. As in RTS2's next_naut(), whole days around the window are
// scanned and the earliest event strictly after the start is kept. Days on
// which the body stays above or below the threshold (non-zero return) have
// no event.
// -----------------------------------------------------------------

template <typename DailyRst>
std::optional<f64> next_event(const DailyRst& daily_rst, Direction direction,
                              f64 start_jd, f64 window_days)
{
    if (window_days <= 0.0)
    {
        return std::nullopt;
    }

    const f64 end_jd = start_jd + window_days;
    std::optional<f64> earliest;

    for (f64 day = std::floor(start_jd) - 1.0; day <= end_jd + 1.0; day += 1.0)
    {
        ln_rst_time rst{};
        if (daily_rst(day, rst) != 0)
        {
            continue;
        }

        const f64 event = (direction == Direction::Rise) ? rst.rise : rst.set;
        if (event > start_jd && event <= end_jd && (!earliest || event < *earliest))
        {
            earliest = event;
        }
    }

    return earliest;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Positions
// -----------------------------------------------------------------

EclipticPosition NovaEphemeris::geocentric_ecliptic(Body body, f64 jd) const
{
    const f64 jd_tt = TimeSystem::ut_to_tt(jd);

    ln_lnlat_posn ecliptic{};
    if (body == Body::Sun)
    {
        ln_get_solar_ecl_coords(jd_tt, &ecliptic);
    }
    else
    {
        ln_equ_posn equatorial = equatorial_of_date(Body::Moon, jd_tt);
        ln_get_ecl_from_equ(&equatorial, jd_tt, &ecliptic);
    }

    return EclipticPosition{
        .lon_deg = Coordinates::normalize_degrees(ecliptic.lng),
        .lat_deg = ecliptic.lat,
        .distance_km = distance_km_at(body, jd_tt),
    };
}

f64 NovaEphemeris::moon_phase_angle(f64 jd) const
{
    return Coordinates::normalize_degrees(geocentric_ecliptic(Body::Moon, jd).lon_deg
                                        - geocentric_ecliptic(Body::Sun, jd).lon_deg);
}

f64 NovaEphemeris::topocentric_altitude(Body body, const Observer& observer, f64 jd) const
{
    const f64 jd_tt = TimeSystem::ut_to_tt(jd);
    ln_lnlat_posn site = to_site(observer);

    ln_equ_posn position = equatorial_of_date(body, jd_tt);
    ln_equ_posn shift{};
    ln_get_parallax(&position, distance_km_at(body, jd_tt) / astro_constants::kAuKm,
                    &site, kObserverHeightM, jd, &shift);
    position.ra += shift.ra;
    position.dec += shift.dec;

    ln_hrz_posn horizontal{};
    ln_get_hrz_from_equ(&position, &site, jd, &horizontal);
    return horizontal.alt;
}

f64 NovaEphemeris::elongation(f64 jd) const
{
    const f64 jd_tt = TimeSystem::ut_to_tt(jd);
    const ln_equ_posn moon = equatorial_of_date(Body::Moon, jd_tt);
    const ln_equ_posn sun = equatorial_of_date(Body::Sun, jd_tt);

    return Coordinates::angular_separation(Coordinates::equatorial_from_degrees(moon.ra, moon.dec),
                                           Coordinates::equatorial_from_degrees(sun.ra, sun.dec))
         * kRadToDeg;
}

f64 NovaEphemeris::geocentric_distance(Body body, f64 jd) const
{
    return distance_km_at(body, TimeSystem::ut_to_tt(jd)) / astro_constants::kAuKm;
}

// -----------------------------------------------------------------
// Rise / set and altitude searches
//
// Rise/set horizons are libnova's standard ones: −0°50′ for the Sun's
// upper limb, +0.125° for the Moon's centre (parallax less semi-diameter
// and refraction).
// -----------------------------------------------------------------

std::optional<f64> NovaEphemeris::find_rise_set(
    Body body, const Observer& observer, Direction direction,
    f64 start_jd, f64 window_days) const
{
    ln_lnlat_posn site = to_site(observer);

    if (body == Body::Sun)
    {
        return next_event([&site](f64 day, ln_rst_time& rst) {
            return ln_get_solar_rst_horizon(day, &site, LN_SOLAR_STANDART_HORIZON, &rst);
        }, direction, start_jd, window_days);
    }

    return next_event([&site](f64 day, ln_rst_time& rst) {
        return ln_get_lunar_rst(day, &site, &rst);
    }, direction, start_jd, window_days);
}

std::optional<f64> NovaEphemeris::find_altitude(
    Body body, const Observer& observer, Direction direction,
    f64 altitude_deg, f64 start_jd, f64 window_days) const
{
    ln_lnlat_posn site = to_site(observer);

    if (body == Body::Sun)
    {
        return next_event([&site, altitude_deg](f64 day, ln_rst_time& rst) {
            return ln_get_solar_rst_horizon(day, &site, altitude_deg, &rst);
        }, direction, start_jd, window_days);
    }

    return next_event([&site, altitude_deg](f64 day, ln_rst_time& rst) {
        return ln_get_body_rst_horizon(day, &site, lunar_equatorial_of_date, altitude_deg, &rst);
    }, direction, start_jd, window_days);
}

// -----------------------------------------------------------------
// Moon phase search
//
// libnova has no phase-time solver. Start from the mean-motion estimate
// of when the phase angle reaches the target, then Newton-iterate on the
// true phase angle. The true rate varies between ~10°/day and ~15°/day,
// so the estimate is always within a few days of the wanted root and far
// from its neighbours one month away.
// -----------------------------------------------------------------

std::optional<f64> NovaEphemeris::find_moon_phase(f64 angle_deg, f64 start_jd, f64 window_days) const
{
    if (window_days == 0.0)
    {
        return std::nullopt;
    }

    constexpr f64 kMeanRate = 360.0 / astro_constants::kSynodicMonth;
    constexpr f64 kDerivativeStep = 0.01;
    constexpr i32 kMaxIterations = 20;

    const auto refine = [&](f64 jd) {
        for (i32 i = 0; i < kMaxIterations; ++i)
        {
            const f64 residual = signed_degrees(moon_phase_angle(jd) - angle_deg);
            if (std::abs(residual) < 1e-7)
            {
                break;
            }
            const f64 rate = signed_degrees(moon_phase_angle(jd + kDerivativeStep)
                                          - moon_phase_angle(jd - kDerivativeStep))
                           / (2.0 * kDerivativeStep);
            jd -= residual / rate;
        }
        return jd;
    };

    const f64 current = moon_phase_angle(start_jd);

    if (window_days > 0.0)
    {
        const f64 ahead = Coordinates::normalize_degrees(angle_deg - current);
        f64 found = refine(start_jd + ahead / kMeanRate);
        if (found < start_jd)
        {
            found = refine(found + astro_constants::kSynodicMonth);
        }
        if (found - start_jd > window_days)
        {
            return std::nullopt;
        }
        return found;
    }

    const f64 behind = Coordinates::normalize_degrees(current - angle_deg);
    f64 found = refine(start_jd - behind / kMeanRate);
    if (found > start_jd)
    {
        found = refine(found - astro_constants::kSynodicMonth);
    }
    if (start_jd - found > -window_days)
    {
        return std::nullopt;
    }
    return found;
}

} // namespace hilal::astro
