/// @file grid_cache.cpp
/// @brief Full-grid memo.

#include "search/grid_cache.hpp"

#include "core/logger.hpp"

namespace hilal::search
{

GridCacheKey GridCache::key_for(const astro::CalendarDate& date, const GridConfig& config)
{
    return GridCacheKey{
        .date = date,
        .lat_step_deg = config.lat_step_deg,
        .lon_step_deg = config.lon_step_deg,
        .lat_limit_deg = config.lat_limit_deg,
    };
}

const FullGridResult* GridCache::find(const astro::CalendarDate& date, const GridConfig& config) const
{
    const auto it = m_entries.find(key_for(date, config));
    return (it != m_entries.end()) ? &it->second : nullptr;
}

void GridCache::store(const GridConfig& config, FullGridResult result)
{
    const astro::CalendarDate date = result.date;
    m_entries.insert_or_assign(key_for(date, config), std::move(result));
    HLL_CORE_TRACE("Grid cache stored {} at {}°×{}° ({} entries)", astro::TimeSystem::format_date(date),
                   config.lat_step_deg, config.lon_step_deg, m_entries.size());
}

void GridCache::clear()
{
    m_entries.clear();
}

} // namespace hilal::search
