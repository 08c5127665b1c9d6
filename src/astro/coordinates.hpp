#pragma once

/// @file coordinates.hpp
/// @brief Observer positions, longitude handling and angular separation.

#include "core/types.hpp"

namespace hilal::astro
{
    /// @brief Equatorial coordinate of date.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief A point on the Earth's surface in degrees.
    ///
    /// Latitude in [-90, 90], longitude east positive. Use normalized() before
    /// comparing or deriving a timezone: it folds the longitude into [-180, 180).
    struct Observer
    {
        f64 latitude_deg = 0.0;
        f64 longitude_deg = 0.0;

        /// @brief Same point with its longitude folded into [-180, 180).
        [[nodiscard]] Observer normalized() const;

        bool operator==(const Observer&) const = default;
    };

    /// @brief Static utility class for angle and longitude arithmetic.
    ///
    /// All angular inputs and outputs are in radians unless the name says _deg.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial coordinate from degrees (RA in degrees, not hours).
        [[nodiscard]] static EquatorialCoord equatorial_from_degrees(f64 ra_deg, f64 dec_deg);

        /// @brief Great-circle separation between two equatorial positions (radians).
        [[nodiscard]] static f64 angular_separation(
            const EquatorialCoord& a,
            const EquatorialCoord& b
        );

        /// @brief Fold a longitude into [-180, 180). +180 maps to -180.
        [[nodiscard]] static f64 normalize_longitude_deg(f64 lon_deg);

        /// @brief Longitude-derived timezone: round(lon / 15) hours, halves away from zero.
        ///
        /// -7.5° gives -1 h (not 0 h). Only used to read a calendar date as a
        /// local evening; it is never treated as a civil timezone.
        [[nodiscard]] static i32 longitude_timezone_hours(f64 lon_deg);

        /// @brief Normalize an angle to the range [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle_deg);
    };

} // namespace hilal::astro
