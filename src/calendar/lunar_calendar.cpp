/// @file lunar_calendar.cpp
/// @brief Two-pass lunar calendar assembly.

#include "calendar/lunar_calendar.hpp"

#include "astro/conjunctions.hpp"
#include "calendar/hijri.hpp"
#include "core/logger.hpp"
#include "search/worker_pool.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace hilal::calendar
{

namespace
{

// Sub-progress within a month assumes about this many searched days
constexpr f64 kEstimatedDaysPerMonth = 30.0;

// Month naming uses the date near full moon
constexpr i32 kNamingOffsetDays = 13;

struct MonthSeed
{
    f64 conjunction;
    Night1Result night1;
    f64 next_conjunction;
    std::string month_name;
    i32 hijri_year;
};

CalendarOutcome cancelled()
{
    HLL_INFO("Lunar calendar cancelled");
    return CalendarOutcome{.status = CalendarStatus::Cancelled, .reason = "Cancelled"};
}

CalendarOutcome failed(std::string reason)
{
    HLL_ERROR("Lunar calendar failed: {}", reason);
    return CalendarOutcome{.status = CalendarStatus::Failed, .reason = std::move(reason)};
}

void report(const ProgressCallback& on_progress, f64 percent, CalendarPass pass, i32 month_index, i32 month_count)
{
    if (on_progress)
    {
        on_progress(ProgressEvent{
            .percent = std::clamp(percent, 0.0, 100.0),
            .pass = pass,
            .month_index = month_index,
            .month_count = month_count,
        });
    }
}

// First calendar day whose midnight is not before jd
astro::CalendarDate first_day_from(f64 jd)
{
    const astro::CalendarDate day = astro::TimeSystem::calendar_date(jd);
    return (astro::TimeSystem::midnight_jd(day) < jd) ? astro::TimeSystem::add_days(day, 1) : day;
}

} // anonymous namespace

std::string_view calendar_status_name(CalendarStatus status)
{
    switch (status)
    {
        case CalendarStatus::Completed: return "completed";
        case CalendarStatus::Cancelled: return "cancelled";
        case CalendarStatus::Failed:    return "failed";
    }
    return "failed";
}

CalendarOutcome compute_lunar_calendar(
    const astro::Ephemeris& ephemeris,
    const astro::CalendarDate& start_date,
    const astro::Observer& observer,
    const CalendarConfig& config,
    const ProgressCallback& on_progress,
    std::stop_token stop)
{
    const astro::Observer location = observer.normalized();
    const i32 month_count = std::max(config.month_count, 0);

    // Joined on every return path below
    search::WorkerPool pool(search::WorkerPoolConfig{
        .worker_count = search::clamped_parallelism(config.grid.min_workers, config.grid.max_workers),
        .live_worker_gauge = config.live_worker_gauge,
    });

    HLL_INFO("Lunar calendar: {} months from {} at ({:.4f}, {:.4f}), {} workers",
             month_count, astro::TimeSystem::format_date(start_date),
             location.latitude_deg, location.longitude_deg, pool.size());

    // ========== Pass 1: conjunctions and Night 1 dates ==========

    // Start one conjunction back so the month containing start_date is included
    const auto first = astro::previous_conjunction(ephemeris, astro::TimeSystem::midnight_jd(start_date));
    if (!first)
    {
        return failed(fmt::format("No conjunction found before {}", astro::TimeSystem::format_date(start_date)));
    }

    const Night1SearchConfig search_config{
        .max_search_days = config.max_search_days,
        .grid = config.grid,
    };

    std::vector<MonthSeed> seeds;
    seeds.reserve(static_cast<usize>(month_count));
    f64 conjunction = *first;

    for (i32 month_index = 0; month_index < month_count; ++month_index)
    {
        if (stop.stop_requested())
        {
            return cancelled();
        }

        const f64 month_base = 50.0 * month_index / month_count;
        const f64 month_share = 50.0 / month_count;
        report(on_progress, month_base, CalendarPass::Night1Dates, month_index, month_count);

        const auto on_day = [&](i32 day_index) {
            const f64 fraction = std::min(day_index / kEstimatedDaysPerMonth, 1.0);
            report(on_progress, month_base + fraction * month_share, CalendarPass::Night1Dates, month_index, month_count);
        };

        Night1Outcome night1 = find_night1(ephemeris, conjunction, location, pool, stop, on_day, search_config);
        if (night1.status == Night1Status::Cancelled)
        {
            return cancelled();
        }
        if (night1.status == Night1Status::Exhausted || !night1.result)
        {
            return failed(night1.reason);
        }

        const auto next = astro::next_conjunction(ephemeris, conjunction + 1.0);
        if (!next)
        {
            return failed(fmt::format("No conjunction found after {}", astro::TimeSystem::format_iso(conjunction)));
        }

        const astro::CalendarDate naming_date = astro::TimeSystem::add_days(night1.result->date, kNamingOffsetDays);
        const HijriDate hijri = gregorian_to_hijri(naming_date);

        HLL_INFO("Pass 1: month {} ({} {}) Night 1 {} [{}]",
                 month_index + 1, hijri_month_name(hijri.month), hijri.year,
                 astro::TimeSystem::format_date(night1.result->date), night1_method_name(night1.result->method));

        seeds.push_back(MonthSeed{
            .conjunction = conjunction,
            .night1 = std::move(*night1.result),
            .next_conjunction = *next,
            .month_name = std::string(hijri_month_name(hijri.month)),
            .hijri_year = hijri.year,
        });

        conjunction = *next;
    }

    // ========== Pass 2: nights of each month ==========

    CalendarResult calendar{.location = location};
    calendar.months.reserve(seeds.size());

    for (usize i = 0; i < seeds.size(); ++i)
    {
        if (stop.stop_requested())
        {
            return cancelled();
        }

        report(on_progress, 50.0 + 50.0 * static_cast<f64>(i) / static_cast<f64>(seeds.size()),
               CalendarPass::MonthDays, static_cast<i32>(i), month_count);

        MonthSeed& seed = seeds[i];
        const bool has_next_month = (i + 1 < seeds.size());

        // Until the next month's Night 1, or for the last month until its next conjunction
        const astro::CalendarDate month_end = has_next_month ? seeds[i + 1].night1.date
                                                             : first_day_from(seed.next_conjunction);
        const i32 night_count = std::max(0, astro::TimeSystem::days_between(seed.night1.date, month_end));

        std::vector<NightDay> days;
        days.reserve(static_cast<usize>(night_count));
        for (i32 n = 0; n < night_count; ++n)
        {
            days.push_back(NightDay{
                .night_number = n + 1,
                .date = astro::TimeSystem::add_days(seed.night1.date, n),
            });
        }

        HLL_INFO("Pass 2: month {} ({}) has {} nights", i + 1, seed.month_name, days.size());

        calendar.months.push_back(MonthRecord{
            .conjunction = seed.conjunction,
            .night1 = std::move(seed.night1),
            .next_conjunction = seed.next_conjunction,
            .month_name = std::move(seed.month_name),
            .hijri_year = seed.hijri_year,
            .days = std::move(days),
        });
    }

    calendar.generated_at = astro::TimeSystem::now_as_jd();
    report(on_progress, 100.0, CalendarPass::MonthDays, month_count, month_count);

    return CalendarOutcome{
        .status = CalendarStatus::Completed,
        .calendar = std::move(calendar),
    };
}

} // namespace hilal::calendar
