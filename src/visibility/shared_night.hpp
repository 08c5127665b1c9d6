#pragma once

/// @file shared_night.hpp
/// @brief Overlap and relative ordering of two night windows.

#include "core/types.hpp"
#include "visibility/night_window.hpp"

namespace hilal::visibility
{
    /// @brief Whether two nights overlap, and by how long.
    struct SharedNightResult
    {
        bool overlaps = false;
        f64 overlap_minutes = 0.0;   ///< 0 when the windows do not overlap

        bool operator==(const SharedNightResult&) const = default;
    };

    /// @brief Sunset of one window relative to another.
    enum class SunsetOrder : u8
    {
        EarlierOrSame,   ///< Other window starts at or before the reference (east of it)
        Later,           ///< Other window starts after the reference (west of it)
    };

    /// @brief Overlap iff max(starts) < min(ends). Commutative.
    [[nodiscard]] SharedNightResult shared_night(const NightWindow& a, const NightWindow& b);

    /// @brief Order of @p other relative to @p reference: other.start ≤ reference.start is EarlierOrSame.
    [[nodiscard]] SunsetOrder relative_order(const NightWindow& reference, const NightWindow& other);

} // namespace hilal::visibility
