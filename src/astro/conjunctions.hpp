#pragma once

/// @file conjunctions.hpp
/// @brief New and full moon lookups around an instant.

#include "astro/ephemeris.hpp"
#include "core/types.hpp"

#include <optional>

namespace hilal::astro
{
    /// @brief Last new moon at or before @p jd (searches 40 days back).
    [[nodiscard]] std::optional<f64> previous_conjunction(const Ephemeris& ephemeris, f64 jd);

    /// @brief First new moon at or after @p jd (searches 40 days ahead).
    [[nodiscard]] std::optional<f64> next_conjunction(const Ephemeris& ephemeris, f64 jd);

    /// @brief The new moon closest to @p jd, looking 20 days either way.
    ///
    /// This is the geocentric conjunction shared by every grid cell of a date.
    [[nodiscard]] std::optional<f64> nearest_conjunction(const Ephemeris& ephemeris, f64 jd);

    /// @brief First full moon at or after @p jd (searches 40 days ahead).
    [[nodiscard]] std::optional<f64> next_full_moon(const Ephemeris& ephemeris, f64 jd);

} // namespace hilal::astro
