#pragma once

/// @file night_window.hpp
/// @brief The interval [sunset, astronomical twilight end) of one observer's evening.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>

namespace hilal::visibility
{
    /// @brief How the end of a night window was obtained.
    enum class NightEndSource : u8
    {
        AstronomicalTwilight,   ///< Sun reached −18° before the next sunrise
        Sunrise,                ///< Twilight never ends, next sunrise used instead
        Synthetic,              ///< Sunrise fallback implied > 20 h; 12 h stand-in
    };

    /// @brief One observer's night. Invariant: night_end > night_start.
    struct NightWindow
    {
        f64 night_start = 0.0;      ///< Sunset (UT Julian Date)
        f64 night_end = 0.0;        ///< Twilight end or fallback (UT Julian Date)
        NightEndSource source = NightEndSource::AstronomicalTwilight;
        bool approximate = false;   ///< Set only for Synthetic windows

        [[nodiscard]] f64 duration_minutes() const
        {
            return (night_end - night_start) * time_constants::kMinutesPerDay;
        }
    };

    /// @brief Compute the night window of @p observer on the evening of @p date.
    ///
    /// Sunset is searched from local noon (longitude timezone) unless
    /// @p known_sunset is given. Twilight end is the Sun's −18° crossing
    /// within 12 h of sunset, rejected when it falls after the next sunrise.
    /// Returns std::nullopt when there is no sunset, or neither a twilight
    /// end nor a sunrise (polar day or night).
    ///
    /// @p conjunction is accepted for interface symmetry with classify_visibility
    /// and does not affect the window.
    [[nodiscard]] std::optional<NightWindow> compute_night_window(
        const astro::Ephemeris& ephemeris,
        const astro::Observer& observer,
        const astro::CalendarDate& date,
        std::optional<f64> conjunction = std::nullopt,
        std::optional<f64> known_sunset = std::nullopt);

} // namespace hilal::visibility
