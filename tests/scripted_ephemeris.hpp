#pragma once

/// @file scripted_ephemeris.hpp
/// @brief Deterministic Ephemeris double shared by the engine tests.
///
/// Every UTC day has a sunset, a −18° twilight crossing and a sunrise at
/// fixed hours. New moons repeat every synodic month from a fixed epoch, and
/// moonset lag and ARCV are functions of the Moon's age. Nothing depends on
/// the observer unless Script::arcv_bonus_deg or Script::sunset_delay_hours
/// says so.

#include "astro/ephemeris.hpp"
#include "core/types.hpp"

#include <cmath>
#include <functional>
#include <optional>
#include <stdexcept>

namespace hilal::test
{
    /// 2024-03-10 09:00 UTC
    inline constexpr f64 kScriptEpochJd = 2460379.875;

    struct Script
    {
        f64 sunset_hour = 18.0;
        f64 sunrise_hour = 6.0;
        std::optional<f64> twilight_hour = 19.5;
        bool has_sunset = true;
        bool has_sunrise = true;

        f64 conjunction_epoch = kScriptEpochJd;
        f64 synodic_days = astro_constants::kSynodicMonth;

        /// Moonset minus sunset (minutes) for a Moon of the given age (days)
        std::function<f64(f64)> lag_minutes = [](f64 age) { return 48.0 * age; };
        /// Moon altitude (degrees) at the given age; the Sun always sits at 0°
        std::function<f64(f64)> arcv_deg = [](f64 age) { return 5.0 * age; };
        /// Extra Moon altitude for particular observers
        std::function<f64(const astro::Observer&)> arcv_bonus_deg;
        /// Sunset delay (hours) for particular observers; twilight is unaffected
        std::function<f64(const astro::Observer&)> sunset_delay_hours;

        bool throw_on_altitude = false;
    };

    class ScriptedEphemeris final : public astro::Ephemeris
    {
    public:
        ScriptedEphemeris() = default;
        explicit ScriptedEphemeris(Script script) : m_script(std::move(script)) {}

        [[nodiscard]] std::optional<f64> find_rise_set(
            astro::Body body, const astro::Observer& observer, astro::Direction direction,
            f64 start_jd, f64 window_days) const override
        {
            if (body == astro::Body::Sun)
            {
                if (direction == astro::Direction::Set)
                {
                    if (!m_script.has_sunset)
                    {
                        return std::nullopt;
                    }
                    const f64 delay = m_script.sunset_delay_hours ? m_script.sunset_delay_hours(observer) : 0.0;
                    return next_daily(start_jd, m_script.sunset_hour + delay, window_days);
                }
                return m_script.has_sunrise ? next_daily(start_jd, m_script.sunrise_hour, window_days)
                                            : std::nullopt;
            }

            if (direction == astro::Direction::Rise)
            {
                return std::nullopt;
            }

            const f64 lag_days = m_script.lag_minutes(moon_age(start_jd)) / time_constants::kMinutesPerDay;
            if (lag_days > window_days)
            {
                return std::nullopt;
            }
            return start_jd + lag_days;
        }

        [[nodiscard]] std::optional<f64> find_altitude(
            astro::Body body, const astro::Observer& /*observer*/, astro::Direction direction,
            f64 altitude_deg, f64 start_jd, f64 window_days) const override
        {
            if (body != astro::Body::Sun || direction != astro::Direction::Set ||
                altitude_deg != -18.0 || !m_script.twilight_hour)
            {
                return std::nullopt;
            }
            return next_daily(start_jd, *m_script.twilight_hour, window_days);
        }

        [[nodiscard]] std::optional<f64> find_moon_phase(
            f64 angle_deg, f64 start_jd, f64 window_days) const override
        {
            const f64 offset = m_script.conjunction_epoch + (angle_deg / 360.0) * m_script.synodic_days;
            const f64 cycles = (start_jd - offset) / m_script.synodic_days;

            const f64 found = (window_days >= 0.0)
                ? offset + (std::floor(cycles) + 1.0) * m_script.synodic_days
                : offset + std::floor(cycles) * m_script.synodic_days;

            if (std::abs(found - start_jd) > std::abs(window_days))
            {
                return std::nullopt;
            }
            return found;
        }

        [[nodiscard]] f64 topocentric_altitude(
            astro::Body body, const astro::Observer& observer, f64 jd) const override
        {
            if (m_script.throw_on_altitude)
            {
                throw std::runtime_error("scripted altitude failure");
            }
            if (body == astro::Body::Sun)
            {
                return 0.0;
            }
            const f64 bonus = m_script.arcv_bonus_deg ? m_script.arcv_bonus_deg(observer) : 0.0;
            return m_script.arcv_deg(moon_age(jd)) + bonus;
        }

        [[nodiscard]] f64 elongation(f64 jd) const override
        {
            const f64 phase = 360.0 * moon_age(jd) / m_script.synodic_days;
            return 180.0 - std::abs(180.0 - phase);
        }

        [[nodiscard]] f64 geocentric_distance(astro::Body body, f64 /*jd*/) const override
        {
            return (body == astro::Body::Moon) ? 384400.0 / astro_constants::kAuKm : 1.0;
        }

        /// Days since the most recent new moon at or before @p jd.
        [[nodiscard]] f64 moon_age(f64 jd) const
        {
            const f64 cycles = std::floor((jd - m_script.conjunction_epoch) / m_script.synodic_days);
            return jd - (m_script.conjunction_epoch + cycles * m_script.synodic_days);
        }

        /// First instant strictly after @p start_jd at @p hour UTC, within @p window_days.
        [[nodiscard]] static std::optional<f64> next_daily(f64 start_jd, f64 hour, f64 window_days)
        {
            const f64 midnight = std::floor(start_jd - 0.5) + 0.5;
            f64 candidate = midnight + hour / time_constants::kHoursPerDay;
            if (candidate <= start_jd)
            {
                candidate += 1.0;
            }
            if (candidate - start_jd > window_days)
            {
                return std::nullopt;
            }
            return candidate;
        }

    private:
        Script m_script{};
    };

} // namespace hilal::test
