#pragma once

/// @file ephemeris.hpp
/// @brief Abstract Sun/Moon position provider consumed by the visibility engine.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <optional>

namespace hilal::astro
{
    /// @brief Bodies the engine asks about.
    enum class Body : u8
    {
        Sun,
        Moon,
    };

    /// @brief Direction of a horizon or altitude crossing.
    enum class Direction : i32
    {
        Rise = 1,   ///< Body ascending through the threshold
        Set  = -1,  ///< Body descending through the threshold
    };

    /// @brief Topocentric rise/set search, angular separation, distance and phase queries.
    ///
    /// Instants are Julian Dates (UT). Search windows are in days; a negative
    /// window searches backwards in time (only find_moon_phase supports that).
    /// Every query is const and implementations must be reentrant: a single
    /// instance is shared by all grid-search workers.
    class Ephemeris
    {
    public:
        virtual ~Ephemeris() = default;

        /// @brief First rise or set of @p body after @p start_jd within @p window_days.
        ///
        /// Rise/set is the apparent upper limb crossing the horizon with
        /// standard refraction.
        [[nodiscard]] virtual std::optional<f64> find_rise_set(
            Body body, const Observer& observer, Direction direction,
            f64 start_jd, f64 window_days) const = 0;

        /// @brief First time after @p start_jd the body's airless centre altitude
        /// crosses @p altitude_deg in the given direction.
        [[nodiscard]] virtual std::optional<f64> find_altitude(
            Body body, const Observer& observer, Direction direction,
            f64 altitude_deg, f64 start_jd, f64 window_days) const = 0;

        /// @brief Instant when the Moon−Sun ecliptic longitude difference equals
        /// @p angle_deg (0 = new moon, 180 = full moon).
        ///
        /// Positive @p window_days searches forward, negative backward; the
        /// nearest qualifying instant in that direction is returned.
        [[nodiscard]] virtual std::optional<f64> find_moon_phase(
            f64 angle_deg, f64 start_jd, f64 window_days) const = 0;

        /// @brief Topocentric altitude of the body centre, no refraction (degrees).
        [[nodiscard]] virtual f64 topocentric_altitude(
            Body body, const Observer& observer, f64 jd) const = 0;

        /// @brief Geocentric angular separation between the Moon and the Sun (degrees).
        [[nodiscard]] virtual f64 elongation(f64 jd) const = 0;

        /// @brief Geocentric distance of the body (astronomical units).
        [[nodiscard]] virtual f64 geocentric_distance(Body body, f64 jd) const = 0;
    };

} // namespace hilal::astro
