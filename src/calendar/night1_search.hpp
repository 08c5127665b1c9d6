#pragma once

/// @file night1_search.hpp
/// @brief Day-by-day search for the first night of a lunar month at one location.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "search/grid_search.hpp"
#include "search/worker_pool.hpp"
#include "visibility/odeh_criterion.hpp"

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace hilal::calendar
{
    /// @brief How Night 1 was established.
    enum class Night1Method : u8
    {
        Direct,                   ///< The crescent is visible from the location itself
        SharedNightInheritance,   ///< Seen elsewhere during a night the location shares
    };

    /// @brief Terminal state of a Night 1 search.
    enum class Night1Status : u8
    {
        Found,
        Exhausted,   ///< No visible night within the search limit (hard failure)
        Cancelled,   ///< Stop requested; not an error
    };

    [[nodiscard]] std::string_view night1_method_name(Night1Method method);

    /// @brief The first night of a month.
    struct Night1Result
    {
        astro::CalendarDate date{};
        Night1Method method = Night1Method::Direct;

        /// Location's own classification when method is Direct
        std::optional<visibility::Classification> direct_classification;

        /// Donor cells when method is SharedNightInheritance, empty otherwise
        std::vector<search::GridCell> inherited_from_cells;
    };

    /// @brief Result of find_night1(); result is engaged only for Found.
    struct Night1Outcome
    {
        Night1Status status = Night1Status::Exhausted;
        std::optional<Night1Result> result;
        std::string reason;
        i32 days_searched = 0;
    };

    /// @brief Called at the start of each searched day with its 0-based index.
    using DayProgress = std::function<void(i32 day_index)>;

    /// @brief Search settings.
    struct Night1SearchConfig
    {
        i32 max_search_days = 35;
        search::GridConfig grid{};
    };

    /// @brief Find Night 1 for the month that begins at @p conjunction_jd.
    ///
    /// Starting at the conjunction's UTC date, each day: poll @p stop, classify
    /// the location directly (with the month's conjunction), and if it is not
    /// visible run the targeted grid search against the location's own night
    /// window. The first day that succeeds either way is Night 1.
    [[nodiscard]] Night1Outcome find_night1(
        const astro::Ephemeris& ephemeris,
        f64 conjunction_jd,
        const astro::Observer& observer,
        search::WorkerPool& pool,
        std::stop_token stop = {},
        const DayProgress& on_day = {},
        const Night1SearchConfig& config = {});

} // namespace hilal::calendar
