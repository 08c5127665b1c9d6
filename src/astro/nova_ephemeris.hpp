#pragma once

/// @file nova_ephemeris.hpp
/// @brief Sun/Moon ephemeris provider backed by libnova.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "core/types.hpp"

#include <optional>

namespace hilal::astro
{
    /// @brief Geocentric ecliptic position of date.
    struct EclipticPosition
    {
        f64 lon_deg;        ///< Ecliptic longitude, [0, 360)
        f64 lat_deg;        ///< Ecliptic latitude
        f64 distance_km;    ///< Geocentric distance
    };

    /// @brief Ephemeris provider built on libnova.
    ///
    /// - Sun: VSOP87 apparent coordinates (ln_get_solar_*)
    /// - Moon: ELP2000-82B (ln_get_lunar_*), precessed from J2000 to date
    /// - Topocentric place: ln_get_parallax at sea level, then ln_get_hrz_from_equ
    /// - Rise/set and altitude events: libnova's daily rst solutions, scanned
    ///   day by day for the first event after the search start
    ///
    /// Positions are evaluated at TT (UT + ΔT); sidereal quantities at UT.
    /// Stateless; every method is const and safe to call from many threads.
    class NovaEphemeris final : public Ephemeris
    {
    public:
        NovaEphemeris() = default;

        [[nodiscard]] std::optional<f64> find_rise_set(
            Body body, const Observer& observer, Direction direction,
            f64 start_jd, f64 window_days) const override;

        [[nodiscard]] std::optional<f64> find_altitude(
            Body body, const Observer& observer, Direction direction,
            f64 altitude_deg, f64 start_jd, f64 window_days) const override;

        [[nodiscard]] std::optional<f64> find_moon_phase(
            f64 angle_deg, f64 start_jd, f64 window_days) const override;

        [[nodiscard]] f64 topocentric_altitude(
            Body body, const Observer& observer, f64 jd) const override;

        [[nodiscard]] f64 elongation(f64 jd) const override;

        [[nodiscard]] f64 geocentric_distance(Body body, f64 jd) const override;

        /// @brief Geocentric ecliptic position of the body at a UT instant.
        [[nodiscard]] EclipticPosition geocentric_ecliptic(Body body, f64 jd) const;

        /// @brief Moon−Sun ecliptic longitude difference in [0, 360) degrees.
        [[nodiscard]] f64 moon_phase_angle(f64 jd) const;
    };

} // namespace hilal::astro
