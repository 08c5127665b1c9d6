/// @file grid_search.cpp
/// @brief Band-partitioned lattice scans.

#include "search/grid_search.hpp"

#include "astro/conjunctions.hpp"
#include "search/grid_cache.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace hilal::search
{

using visibility::NightWindow;

namespace
{

// Anchor's own cell is recognised within this tolerance (degrees)
constexpr f64 kSameCellToleranceDeg = 0.1;

struct NightSample
{
    astro::Observer observer;
    std::optional<NightWindow> window;
};

struct DateConjunctions
{
    std::optional<f64> nearest;
    std::optional<f64> previous;
    std::optional<f64> next;
};

DateConjunctions conjunctions_for(const astro::Ephemeris& ephemeris, const astro::CalendarDate& date)
{
    const f64 midnight = astro::TimeSystem::midnight_jd(date);
    return DateConjunctions{
        .nearest  = astro::nearest_conjunction(ephemeris, midnight),
        .previous = astro::previous_conjunction(ephemeris, midnight),
        .next     = astro::next_conjunction(ephemeris, midnight),
    };
}

bool is_same_cell(const astro::Observer& a, const astro::Observer& b)
{
    return std::abs(a.latitude_deg - b.latitude_deg) < kSameCellToleranceDeg
        && std::abs(a.longitude_deg - b.longitude_deg) < kSameCellToleranceDeg;
}

/// Run @p scan_row over every row of every band, one band per worker.
template <typename Cell, typename RowScan>
std::vector<std::future<std::vector<Cell>>> dispatch_bands(
    WorkerPool& pool, const GridConfig& config, std::stop_token stop, RowScan scan_row)
{
    const auto bands = partition_bands(config, pool.size());
    const auto rows_per_band = assign_rows_to_bands(config, bands);
    const auto longitudes = lattice_longitudes(config);

    std::vector<std::future<std::vector<Cell>>> futures;
    futures.reserve(rows_per_band.size());

    for (const auto& rows : rows_per_band)
    {
        futures.push_back(pool.submit([rows, longitudes, stop, scan_row]() {
            std::vector<Cell> cells;
            for (const f64 lat : rows)
            {
                if (stop.stop_requested())
                {
                    break;
                }
                for (const f64 lon : longitudes)
                {
                    scan_row(astro::Observer{.latitude_deg = lat, .longitude_deg = lon}, cells);
                }
            }
            return cells;
        }));
    }

    return futures;
}

AnchorSummary summarize_anchor(
    const astro::Observer& anchor,
    const astro::Observer& anchor_cell,
    const NightWindow& anchor_window,
    const std::vector<NightSample>& samples)
{
    AnchorSummary summary{
        .anchor = anchor,
        .anchor_cell = anchor_cell,
        .night_window = anchor_window,
    };

    std::map<f64, usize> shared_per_row;

    for (const auto& sample : samples)
    {
        if (!sample.window || is_same_cell(sample.observer, anchor_cell))
        {
            continue;
        }

        const auto shared = visibility::shared_night(anchor_window, *sample.window);
        if (!shared.overlaps)
        {
            continue;
        }

        SharedNightCell cell{
            .observer = sample.observer,
            .night_window = *sample.window,
            .shared = shared,
        };

        if (visibility::relative_order(anchor_window, *sample.window) == visibility::SunsetOrder::Later)
        {
            summary.later.push_back(cell);
        }
        else
        {
            summary.earlier_or_same.push_back(cell);
        }
        ++shared_per_row[sample.observer.latitude_deg];
    }

    for (const auto& [lat, count] : shared_per_row)
    {
        if (count > summary.max_shared_count)
        {
            summary.max_shared_count = count;
            summary.max_shared_latitude = lat;
        }
    }

    return summary;
}

std::vector<NightSample> samples_from_cells(const std::vector<GridCell>& cells)
{
    std::vector<NightSample> samples;
    samples.reserve(cells.size());
    for (const auto& cell : cells)
    {
        samples.push_back(NightSample{.observer = cell.observer, .window = cell.night_window});
    }
    return samples;
}

std::optional<AnchorSummary> anchor_summary_from_cells(
    const astro::Ephemeris& ephemeris,
    const astro::CalendarDate& date,
    const astro::Observer& anchor,
    const GridConfig& config,
    std::vector<GridCell>& cells)
{
    const astro::Observer normalized = anchor.normalized();
    const auto anchor_window = visibility::compute_night_window(ephemeris, normalized, date);
    if (!anchor_window)
    {
        HLL_CORE_WARN("Anchor ({:.2f}, {:.2f}) has no night on {}; no shared-night summary",
                      normalized.latitude_deg, normalized.longitude_deg, astro::TimeSystem::format_date(date));
        return std::nullopt;
    }

    const astro::Observer anchor_cell = containing_cell(config, normalized);
    for (auto& cell : cells)
    {
        if (cell.night_window)
        {
            cell.shared_night = visibility::shared_night(*anchor_window, *cell.night_window);
        }
    }

    return summarize_anchor(normalized, anchor_cell, *anchor_window, samples_from_cells(cells));
}

} // anonymous namespace

// -----------------------------------------------------------------
// Lattice layout
// -----------------------------------------------------------------

std::vector<f64> lattice_latitudes(const GridConfig& config)
{
    const auto rows = static_cast<usize>(std::lround(2.0 * config.lat_limit_deg / config.lat_step_deg));
    std::vector<f64> latitudes;
    latitudes.reserve(rows);
    for (usize i = 0; i < rows; ++i)
    {
        latitudes.push_back(-config.lat_limit_deg + config.lat_step_deg * (static_cast<f64>(i) + 0.5));
    }
    return latitudes;
}

std::vector<f64> lattice_longitudes(const GridConfig& config)
{
    const auto columns = static_cast<usize>(std::lround(360.0 / config.lon_step_deg));
    std::vector<f64> longitudes;
    longitudes.reserve(columns);
    for (usize j = 0; j < columns; ++j)
    {
        longitudes.push_back(-180.0 + config.lon_step_deg * (static_cast<f64>(j) + 0.5));
    }
    return longitudes;
}

std::vector<LatitudeBand> partition_bands(const GridConfig& config, usize count)
{
    count = std::max<usize>(count, 1);
    const f64 width = 2.0 * config.lat_limit_deg / static_cast<f64>(count);

    std::vector<LatitudeBand> bands;
    bands.reserve(count);
    for (usize i = 0; i < count; ++i)
    {
        const f64 start = -config.lat_limit_deg + width * static_cast<f64>(i);
        const f64 end = (i + 1 == count) ? config.lat_limit_deg : start + width;
        bands.push_back(LatitudeBand{.lat_start = start, .lat_end = end});
    }
    return bands;
}

std::vector<std::vector<f64>> assign_rows_to_bands(
    const GridConfig& config, const std::vector<LatitudeBand>& bands)
{
    std::vector<std::vector<f64>> rows_per_band(bands.size());
    if (bands.empty())
    {
        return rows_per_band;
    }

    // Each row goes to the band containing its centre; the top edge belongs to the last band
    for (const f64 lat : lattice_latitudes(config))
    {
        usize index = bands.size() - 1;
        for (usize i = 0; i < bands.size(); ++i)
        {
            if (lat >= bands[i].lat_start && lat < bands[i].lat_end)
            {
                index = i;
                break;
            }
        }
        rows_per_band[index].push_back(lat);
    }
    return rows_per_band;
}

astro::Observer containing_cell(const GridConfig& config, const astro::Observer& observer)
{
    const astro::Observer normalized = observer.normalized();
    const f64 lat_origin = -config.lat_limit_deg;

    const f64 row = std::floor((normalized.latitude_deg - lat_origin) / config.lat_step_deg);
    const f64 column = std::floor((normalized.longitude_deg + 180.0) / config.lon_step_deg);

    return astro::Observer{
        .latitude_deg  = lat_origin + config.lat_step_deg * (row + 0.5),
        .longitude_deg = -180.0 + config.lon_step_deg * (column + 0.5),
    };
}

// -----------------------------------------------------------------
// Targeted search
// -----------------------------------------------------------------

std::optional<std::vector<GridCell>> search_grid_for_shared_visibility(
    const astro::Ephemeris& ephemeris,
    const NightWindow& target,
    const astro::CalendarDate& date,
    WorkerPool& pool,
    std::stop_token stop,
    const GridConfig& config)
{
    if (stop.stop_requested())
    {
        return std::nullopt;
    }

    const auto conjunction = astro::nearest_conjunction(ephemeris, astro::TimeSystem::midnight_jd(date));
    const astro::Ephemeris* eph = &ephemeris;

    auto futures = dispatch_bands<GridCell>(pool, config, stop,
        [eph, target, date, conjunction](const astro::Observer& observer, std::vector<GridCell>& cells) {
            const auto window = visibility::compute_night_window(*eph, observer, date, conjunction);
            if (!window)
            {
                return;
            }

            const auto shared = visibility::shared_night(target, *window);
            if (!shared.overlaps)
            {
                return;
            }

            // The target's sunset must not precede the donor's
            if (target.night_start < window->night_start)
            {
                return;
            }

            auto result = visibility::classify_visibility(*eph, observer, date, conjunction);
            if (!visibility::is_visible(result.classification))
            {
                return;
            }

            cells.push_back(GridCell{
                .observer = observer,
                .visibility = std::move(result),
                .night_window = window,
                .shared_night = shared,
            });
        });

    auto cells = collect_bands(futures);

    if (stop.stop_requested())
    {
        return std::nullopt;
    }

    HLL_CORE_DEBUG("Shared-visibility search for {}: {} donor cells",
                   astro::TimeSystem::format_date(date), cells.size());
    return cells;
}

std::optional<std::vector<GridCell>> search_grid_for_shared_visibility(
    const astro::Ephemeris& ephemeris,
    const NightWindow& target,
    const astro::CalendarDate& date,
    usize parallelism,
    std::stop_token stop,
    const GridConfig& config)
{
    WorkerPool pool(WorkerPoolConfig{
        .worker_count = std::clamp(parallelism, config.min_workers, std::max(config.min_workers, config.max_workers)),
    });
    return search_grid_for_shared_visibility(ephemeris, target, date, pool, stop, config);
}

// -----------------------------------------------------------------
// Full grid
// -----------------------------------------------------------------

std::optional<FullGridResult> compute_full_grid(
    const astro::Ephemeris& ephemeris,
    const astro::CalendarDate& date,
    const std::optional<astro::Observer>& anchor,
    WorkerPool& pool,
    std::stop_token stop,
    const GridConfig& config,
    GridCache* cache)
{
    if (stop.stop_requested())
    {
        return std::nullopt;
    }

    FullGridResult result;

    if (const FullGridResult* cached = cache ? cache->find(date, config) : nullptr)
    {
        HLL_CORE_DEBUG("Full grid for {} served from cache", astro::TimeSystem::format_date(date));
        result = *cached;
        result.anchor.reset();
        for (auto& cell : result.cells)
        {
            cell.shared_night.reset();
        }
    }
    else
    {
        const DateConjunctions conjunctions = conjunctions_for(ephemeris, date);
        const auto conjunction = conjunctions.nearest;
        const astro::Ephemeris* eph = &ephemeris;

        auto futures = dispatch_bands<GridCell>(pool, config, stop,
            [eph, date, conjunction](const astro::Observer& observer, std::vector<GridCell>& cells) {
                auto vis = visibility::classify_visibility(*eph, observer, date, conjunction);

                // Reuse the sunset just found instead of searching again
                std::optional<NightWindow> window;
                if (vis.sunset > 0.0)
                {
                    window = visibility::compute_night_window(*eph, observer, date, conjunction, vis.sunset);
                }

                cells.push_back(GridCell{
                    .observer = observer,
                    .visibility = std::move(vis),
                    .night_window = window,
                });
            });

        result.cells = collect_bands(futures);
        if (stop.stop_requested())
        {
            return std::nullopt;
        }

        result.date = date;
        result.conjunction = conjunctions.nearest;
        result.previous_conjunction = conjunctions.previous;
        result.next_conjunction = conjunctions.next;

        if (cache)
        {
            cache->store(config, result);
        }
    }

    if (anchor)
    {
        result.anchor = anchor_summary_from_cells(ephemeris, date, *anchor, config, result.cells);
    }

    HLL_CORE_INFO("Full grid for {}: {} cells", astro::TimeSystem::format_date(date), result.cells.size());
    return result;
}

// -----------------------------------------------------------------
// Shared-night classification
// -----------------------------------------------------------------

std::optional<AnchorSummary> classify_shared_night(
    const astro::Ephemeris& ephemeris,
    const astro::CalendarDate& date,
    const astro::Observer& anchor,
    WorkerPool& pool,
    std::stop_token stop,
    const GridConfig& config,
    GridCache* cache)
{
    if (stop.stop_requested())
    {
        return std::nullopt;
    }

    const astro::Observer normalized = anchor.normalized();
    const auto anchor_window = visibility::compute_night_window(ephemeris, normalized, date);
    if (!anchor_window)
    {
        HLL_CORE_WARN("Anchor ({:.2f}, {:.2f}) has no night on {}",
                      normalized.latitude_deg, normalized.longitude_deg, astro::TimeSystem::format_date(date));
        return std::nullopt;
    }

    std::vector<NightSample> samples;

    if (const FullGridResult* cached = cache ? cache->find(date, config) : nullptr)
    {
        samples = samples_from_cells(cached->cells);
    }
    else
    {
        const auto conjunction = astro::nearest_conjunction(ephemeris, astro::TimeSystem::midnight_jd(date));
        const astro::Ephemeris* eph = &ephemeris;

        auto futures = dispatch_bands<NightSample>(pool, config, stop,
            [eph, date, conjunction](const astro::Observer& observer, std::vector<NightSample>& out) {
                out.push_back(NightSample{
                    .observer = observer,
                    .window = visibility::compute_night_window(*eph, observer, date, conjunction),
                });
            });

        samples = collect_bands(futures);
        if (stop.stop_requested())
        {
            return std::nullopt;
        }
    }

    return summarize_anchor(normalized, containing_cell(config, normalized), *anchor_window, samples);
}

} // namespace hilal::search
