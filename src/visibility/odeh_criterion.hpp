#pragma once

/// @file odeh_criterion.hpp
/// @brief Crescent geometry at the local evening and Odeh's V-criterion classification.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace hilal::visibility
{
    /// @brief Odeh visibility zones plus the two non-optical outcomes.
    enum class Classification : u8
    {
        EasilyVisible,                  ///< V ≥ 5.65
        VisibleUnderPerfectConditions,  ///< 2 ≤ V < 5.65
        VisibleWithOpticalAid,          ///< −0.96 ≤ V < 2
        NotVisible,                     ///< V < −0.96
        Impossible,                     ///< Moon sets first, or conjunction after sunset
        Undetermined,                   ///< Sunset or moonset could not be resolved
    };

    /// @brief Short code used in tables and CSV output ("EV", "VP", "VO", "NV", "I", "U").
    [[nodiscard]] std::string_view classification_code(Classification classification);

    /// @brief Human-readable zone name ("Easily Visible", ...).
    [[nodiscard]] std::string_view classification_name(Classification classification);

    /// @brief True for the three zones in which the crescent can be seen at all.
    [[nodiscard]] bool is_visible(Classification classification);

    /// @brief Odeh limit L(W) = −0.1018·W³ + 0.7319·W² − 6.3226·W + 7.1651.
    [[nodiscard]] f64 odeh_limit(f64 crescent_width_arcmin);

    /// @brief Threshold V into its zone. Boundaries belong to the higher zone.
    [[nodiscard]] Classification classify_v(f64 v_value);

    /// @brief Everything computed for one observer on one local evening.
    ///
    /// Instants are UT Julian Dates; the local_* fields render them in the
    /// longitude-derived timezone. Fields after the failing step keep their
    /// zero defaults when the classification is Undetermined or Impossible.
    struct VisibilityResult
    {
        astro::Observer observer;                 ///< Normalized observer
        astro::CalendarDate date{};               ///< Evening the result is for
        i32 tz_hours = 0;                         ///< round(longitude / 15)

        Classification classification = Classification::Undetermined;
        std::optional<f64> v_value;               ///< Only when the optical criterion ran

        f64 sunset = 0.0;
        f64 moonset = 0.0;
        f64 lag_minutes = 0.0;
        f64 best_time = 0.0;                      ///< sunset + 4/9 · lag

        f64 arcv_deg = 0.0;                       ///< Airless Moon − Sun altitude at best time
        f64 elongation_deg = 0.0;                 ///< ARCL at best time
        f64 moon_semi_diameter_arcmin = 0.0;
        f64 crescent_width_arcmin = 0.0;

        std::optional<f64> conjunction;
        bool conjunction_triggered = false;
        std::optional<std::string> failure_reason;

        /// @brief Local wall-clock rendering of a UT instant ("YYYY-MM-DDTHH:MM:SS+HH").
        [[nodiscard]] std::string local_time(f64 jd) const;
    };

    /// @brief Julian Date of local midnight starting @p date at longitude-derived tz.
    [[nodiscard]] f64 local_midnight_jd(const astro::CalendarDate& date, i32 tz_hours);

    /// @brief Classify crescent visibility for @p observer on the evening of @p date.
    ///
    /// 1. sunset: first Sun set after local noon (1-day window), else Undetermined
    /// 2. moonset: first Moon set after sunset (2-day window), else Undetermined
    /// 3. lag ≤ 0 → Impossible
    /// 4. conjunction strictly between sunset and the next sunrise → Impossible
    /// 5. ARCV and W at best time, then V = ARCV − L(W)
    ///
    /// Never throws; ephemeris failures become Undetermined with a reason.
    [[nodiscard]] VisibilityResult classify_visibility(
        const astro::Ephemeris& ephemeris,
        const astro::Observer& observer,
        const astro::CalendarDate& date,
        std::optional<f64> conjunction = std::nullopt);

} // namespace hilal::visibility
