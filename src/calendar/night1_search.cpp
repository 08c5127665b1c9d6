/// @file night1_search.cpp
/// @brief Night 1 state machine: Searching(day) → Found | Exhausted | Cancelled.

#include "calendar/night1_search.hpp"

#include "core/logger.hpp"
#include "visibility/night_window.hpp"

#include <spdlog/fmt/fmt.h>

namespace hilal::calendar
{

std::string_view night1_method_name(Night1Method method)
{
    switch (method)
    {
        case Night1Method::Direct:                 return "direct";
        case Night1Method::SharedNightInheritance: return "shared_night";
    }
    return "direct";
}

Night1Outcome find_night1(
    const astro::Ephemeris& ephemeris,
    f64 conjunction_jd,
    const astro::Observer& observer,
    search::WorkerPool& pool,
    std::stop_token stop,
    const DayProgress& on_day,
    const Night1SearchConfig& config)
{
    const astro::Observer location = observer.normalized();
    const astro::CalendarDate first_day = astro::TimeSystem::calendar_date(conjunction_jd);

    HLL_CORE_DEBUG("Night 1 search from conjunction {} at ({:.4f}, {:.4f})",
                   astro::TimeSystem::format_iso(conjunction_jd),
                   location.latitude_deg, location.longitude_deg);

    Night1Outcome outcome;

    for (i32 day_index = 0; day_index < config.max_search_days; ++day_index)
    {
        if (stop.stop_requested())
        {
            outcome.status = Night1Status::Cancelled;
            outcome.reason = "Cancelled";
            return outcome;
        }

        if (on_day)
        {
            on_day(day_index);
        }

        const astro::CalendarDate day = astro::TimeSystem::add_days(first_day, day_index);
        outcome.days_searched = day_index + 1;

        const auto direct = visibility::classify_visibility(ephemeris, location, day, conjunction_jd);
        HLL_CORE_TRACE("Night 1 day {}: {} direct {}", day_index,
                       astro::TimeSystem::format_date(day), visibility::classification_code(direct.classification));

        if (visibility::is_visible(direct.classification))
        {
            HLL_CORE_INFO("Night 1 found on {} by direct visibility ({})",
                          astro::TimeSystem::format_date(day), visibility::classification_code(direct.classification));
            outcome.status = Night1Status::Found;
            outcome.result = Night1Result{
                .date = day,
                .method = Night1Method::Direct,
                .direct_classification = direct.classification,
            };
            return outcome;
        }

        const auto target = visibility::compute_night_window(ephemeris, location, day, conjunction_jd);
        if (!target)
        {
            HLL_CORE_TRACE("Night 1 day {}: location has no night window, shared-night check skipped", day_index);
            continue;
        }

        auto donors = search::search_grid_for_shared_visibility(ephemeris, *target, day, pool, stop, config.grid);
        if (!donors)
        {
            outcome.status = Night1Status::Cancelled;
            outcome.reason = "Cancelled";
            return outcome;
        }

        if (!donors->empty())
        {
            HLL_CORE_INFO("Night 1 found on {} by shared night ({} donor cells)",
                          astro::TimeSystem::format_date(day), donors->size());
            outcome.status = Night1Status::Found;
            outcome.result = Night1Result{
                .date = day,
                .method = Night1Method::SharedNightInheritance,
                .inherited_from_cells = std::move(*donors),
            };
            return outcome;
        }
    }

    outcome.status = Night1Status::Exhausted;
    outcome.reason = fmt::format("No visible night within {} days of conjunction {}",
                                 config.max_search_days, astro::TimeSystem::format_iso(conjunction_jd));
    HLL_CORE_ERROR("Night 1 search exhausted: {}", outcome.reason);
    return outcome;
}

} // namespace hilal::calendar
