#pragma once

/// @file lunar_calendar.hpp
/// @brief Two-pass assembly of consecutive lunar months for one location.

#include "astro/coordinates.hpp"
#include "astro/ephemeris.hpp"
#include "astro/time_system.hpp"
#include "calendar/night1_search.hpp"
#include "core/types.hpp"
#include "search/grid_search.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace hilal::calendar
{
    /// @brief Calendar request settings.
    struct CalendarConfig
    {
        i32 month_count = 2;
        i32 max_search_days = 35;
        search::GridConfig grid{};

        /// Optional gauge handed to the request's worker pool
        std::shared_ptr<std::atomic<i32>> live_worker_gauge;
    };

    /// @brief Which half of the computation a progress event belongs to.
    enum class CalendarPass : u8
    {
        Night1Dates,   ///< Pass 1: 0–50 %
        MonthDays,     ///< Pass 2: 50–100 %
    };

    /// @brief Periodic progress report, percent in [0, 100].
    struct ProgressEvent
    {
        f64 percent = 0.0;
        CalendarPass pass = CalendarPass::Night1Dates;
        i32 month_index = 0;
        i32 month_count = 0;
    };

    using ProgressCallback = std::function<void(const ProgressEvent&)>;

    /// @brief One night of a month; night_number starts at 1.
    struct NightDay
    {
        i32 night_number;
        astro::CalendarDate date;
    };

    /// @brief One assembled lunar month.
    struct MonthRecord
    {
        f64 conjunction = 0.0;
        Night1Result night1;
        f64 next_conjunction = 0.0;
        std::string month_name;          ///< Hijri month of the date 13 days after Night 1
        i32 hijri_year = 0;
        std::vector<NightDay> days;      ///< Night 1 up to the next month's Night 1 (exclusive)
    };

    /// @brief The caller-owned calendar.
    struct CalendarResult
    {
        astro::Observer location;
        std::vector<MonthRecord> months;
        f64 generated_at = 0.0;          ///< Julian Date the calendar was produced
    };

    enum class CalendarStatus : u8
    {
        Completed,
        Cancelled,   ///< Stop requested; not an error
        Failed,      ///< Conjunction search failed or Night 1 was exhausted
    };

    /// @brief Result of compute_lunar_calendar(); calendar is engaged only for Completed.
    struct CalendarOutcome
    {
        CalendarStatus status = CalendarStatus::Failed;
        std::optional<CalendarResult> calendar;
        std::string reason;
    };

    [[nodiscard]] std::string_view calendar_status_name(CalendarStatus status);

    /// @brief Build @p config.month_count months for @p observer, starting with the
    /// month that contains @p start_date.
    ///
    /// Pass 1 finds every month's conjunction and Night 1, pass 2 lays out the
    /// nights so that each month ends the day before the next month's Night 1
    /// (the last month ends before its next conjunction). A worker pool is
    /// created for the request and joined before returning on every path.
    [[nodiscard]] CalendarOutcome compute_lunar_calendar(
        const astro::Ephemeris& ephemeris,
        const astro::CalendarDate& start_date,
        const astro::Observer& observer,
        const CalendarConfig& config = {},
        const ProgressCallback& on_progress = {},
        std::stop_token stop = {});

} // namespace hilal::calendar
