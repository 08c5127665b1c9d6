#pragma once

/// @file grid_cache.hpp
/// @brief Request-owned memo of full-grid results keyed by date and lattice.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "search/grid_search.hpp"

#include <compare>
#include <map>

namespace hilal::search
{
    /// @brief A grid is reusable only for the same date on the same lattice.
    ///
    /// Worker bounds are left out: they change how a grid is computed, not
    /// what it contains.
    struct GridCacheKey
    {
        astro::CalendarDate date{};
        f64 lat_step_deg = 0.0;
        f64 lon_step_deg = 0.0;
        f64 lat_limit_deg = 0.0;

        auto operator<=>(const GridCacheKey&) const = default;
    };

    /// @brief Full-grid results for the dates one request has already scanned.
    ///
    /// Owned by the request context that creates it and passed explicitly to
    /// compute_full_grid / classify_shared_night. Only the coordinating thread
    /// touches it. clear() drops everything.
    class GridCache
    {
    public:
        /// @brief Cached grid for @p date on the lattice of @p config, or nullptr.
        [[nodiscard]] const FullGridResult* find(const astro::CalendarDate& date, const GridConfig& config) const;

        /// @brief Store (or replace) the grid for result.date on the lattice of @p config.
        void store(const GridConfig& config, FullGridResult result);

        void clear();

        [[nodiscard]] usize size() const { return m_entries.size(); }

    private:
        [[nodiscard]] static GridCacheKey key_for(const astro::CalendarDate& date, const GridConfig& config);

        std::map<GridCacheKey, FullGridResult> m_entries;
    };

} // namespace hilal::search
