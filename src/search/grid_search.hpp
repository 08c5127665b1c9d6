#pragma once

/// @file grid_search.hpp
/// @brief Global lattice scans: targeted shared-visibility search and the full visibility grid.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "search/worker_pool.hpp"
#include "visibility/night_window.hpp"
#include "visibility/odeh_criterion.hpp"
#include "visibility/shared_night.hpp"

#include <exception>
#include <future>
#include <iterator>
#include <optional>
#include <stop_token>
#include <vector>

namespace hilal::search
{
    class GridCache;

    /// @brief Lattice resolution and worker bounds.
    struct GridConfig
    {
        f64 lat_step_deg = 2.0;
        f64 lon_step_deg = 2.0;
        f64 lat_limit_deg = 60.0;   ///< Lattice spans [-limit, +limit] in latitude
        usize min_workers = 4;
        usize max_workers = 16;
    };

    /// @brief One equal-width slice of the latitude range, [lat_start, lat_end).
    struct LatitudeBand
    {
        f64 lat_start;
        f64 lat_end;
    };

    /// @brief One lattice point with everything computed for it.
    struct GridCell
    {
        astro::Observer observer;
        visibility::VisibilityResult visibility;
        std::optional<visibility::NightWindow> night_window;

        /// Overlap with the target (targeted search) or anchor (full grid)
        std::optional<visibility::SharedNightResult> shared_night;
    };

    /// @brief A cell that shares the anchor's night, without visibility.
    struct SharedNightCell
    {
        astro::Observer observer;
        visibility::NightWindow night_window;
        visibility::SharedNightResult shared;
    };

    /// @brief Cells sharing an anchor's night, split by sunset order.
    struct AnchorSummary
    {
        astro::Observer anchor;                      ///< Observer as given (normalized)
        astro::Observer anchor_cell;                 ///< Lattice cell containing it
        visibility::NightWindow night_window;        ///< The anchor's own night
        std::vector<SharedNightCell> earlier_or_same;
        std::vector<SharedNightCell> later;
        std::optional<f64> max_shared_latitude;      ///< Row with the most shared cells
        usize max_shared_count = 0;
    };

    /// @brief Full-grid output for one date.
    struct FullGridResult
    {
        astro::CalendarDate date{};
        std::vector<GridCell> cells;                 ///< Band order, then scan order within a band
        std::optional<f64> conjunction;              ///< Nearest conjunction, shared by every cell
        std::optional<f64> previous_conjunction;
        std::optional<f64> next_conjunction;
        std::optional<AnchorSummary> anchor;
    };

    // -----------------------------------------------------------------
    // Lattice layout
    // -----------------------------------------------------------------

    /// @brief Row centres: -limit + step/2 ... +limit - step/2 (−59 … 59 by default).
    [[nodiscard]] std::vector<f64> lattice_latitudes(const GridConfig& config);

    /// @brief Column centres: -180 + step/2 ... 180 - step/2 (−179 … 179 by default).
    [[nodiscard]] std::vector<f64> lattice_longitudes(const GridConfig& config);

    /// @brief Split [-limit, +limit] into @p count contiguous equal-width bands.
    [[nodiscard]] std::vector<LatitudeBand> partition_bands(const GridConfig& config, usize count);

    /// @brief Lattice rows owned by each band. Every row lands in exactly one band.
    [[nodiscard]] std::vector<std::vector<f64>> assign_rows_to_bands(
        const GridConfig& config, const std::vector<LatitudeBand>& bands);

    /// @brief Centre of the lattice cell that contains @p observer.
    [[nodiscard]] astro::Observer containing_cell(const GridConfig& config, const astro::Observer& observer);

    /// @brief Wait for every band and concatenate their cells in band order.
    ///
    /// A band whose task threw is logged and contributes nothing; the
    /// remaining bands are still collected.
    template <typename Cell>
    [[nodiscard]] std::vector<Cell> collect_bands(std::vector<std::future<std::vector<Cell>>>& futures)
    {
        std::vector<Cell> merged;
        for (usize i = 0; i < futures.size(); ++i)
        {
            try
            {
                std::vector<Cell> part = futures[i].get();
                merged.insert(merged.end(),
                              std::make_move_iterator(part.begin()),
                              std::make_move_iterator(part.end()));
            }
            catch (const std::exception& e)
            {
                HLL_CORE_WARN("Grid band {} of {} failed, treated as empty: {}", i + 1, futures.size(), e.what());
            }
        }
        return merged;
    }

    // -----------------------------------------------------------------
    // Scans
    // -----------------------------------------------------------------

    /// @brief Cells that directly see the crescent and can donate it to the target's night.
    ///
    /// One band per pool worker. For each cell: night window (skip if none),
    /// overlap with @p target (skip if none), target sunset not earlier than
    /// the cell's, then the full visibility check; VO, VP and EV cells are kept.
    /// All cells share the conjunction nearest to @p date.
    ///
    /// @return The matching cells, or std::nullopt when @p stop was requested.
    [[nodiscard]] std::optional<std::vector<GridCell>> search_grid_for_shared_visibility(
        const astro::Ephemeris& ephemeris,
        const visibility::NightWindow& target,
        const astro::CalendarDate& date,
        WorkerPool& pool,
        std::stop_token stop = {},
        const GridConfig& config = {});

    /// @brief Same search on a pool of clamp(@p parallelism, min, max) workers owned by the call.
    [[nodiscard]] std::optional<std::vector<GridCell>> search_grid_for_shared_visibility(
        const astro::Ephemeris& ephemeris,
        const visibility::NightWindow& target,
        const astro::CalendarDate& date,
        usize parallelism,
        std::stop_token stop = {},
        const GridConfig& config = {});

    /// @brief Visibility and night window for every cell, plus an optional anchor summary.
    ///
    /// When @p cache holds a grid for @p date its cells are reused; otherwise the
    /// fresh grid is stored there.
    ///
    /// @return std::nullopt when @p stop was requested.
    [[nodiscard]] std::optional<FullGridResult> compute_full_grid(
        const astro::Ephemeris& ephemeris,
        const astro::CalendarDate& date,
        const std::optional<astro::Observer>& anchor,
        WorkerPool& pool,
        std::stop_token stop = {},
        const GridConfig& config = {},
        GridCache* cache = nullptr);

    /// @brief Night-window-only split of the lattice around @p anchor.
    ///
    /// Reuses cached night windows for @p date when @p cache has them.
    /// @return std::nullopt when cancelled or when the anchor has no night.
    [[nodiscard]] std::optional<AnchorSummary> classify_shared_night(
        const astro::Ephemeris& ephemeris,
        const astro::CalendarDate& date,
        const astro::Observer& anchor,
        WorkerPool& pool,
        std::stop_token stop = {},
        const GridConfig& config = {},
        GridCache* cache = nullptr);

} // namespace hilal::search
