/// @file shared_night.cpp
/// @brief Night window overlap.

#include "visibility/shared_night.hpp"

#include <algorithm>

namespace hilal::visibility
{

SharedNightResult shared_night(const NightWindow& a, const NightWindow& b)
{
    const f64 overlap_start = std::max(a.night_start, b.night_start);
    const f64 overlap_end = std::min(a.night_end, b.night_end);

    if (overlap_start < overlap_end)
    {
        return SharedNightResult{
            .overlaps = true,
            .overlap_minutes = (overlap_end - overlap_start) * time_constants::kMinutesPerDay,
        };
    }

    return SharedNightResult{};
}

SunsetOrder relative_order(const NightWindow& reference, const NightWindow& other)
{
    return (other.night_start <= reference.night_start) ? SunsetOrder::EarlierOrSame : SunsetOrder::Later;
}

} // namespace hilal::visibility
