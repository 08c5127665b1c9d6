// src/main.cpp - Hilal command-line entry point
//
// Sub-commands:
//  visibility <lat> <lon> <YYYY-MM-DD>                 classify one evening
//  calendar   <lat> <lon> <YYYY-MM-DD> [months] [csv]  lunar months (Ctrl-C cancels)
//  grid       <YYYY-MM-DD> <out.csv> [lat lon]         full visibility grid
//  debug      <YYYY-MM-DD> <points.csv> <out.csv>      per-point diagnostics

#include "astro/conjunctions.hpp"
#include "astro/nova_ephemeris.hpp"
#include "astro/time_system.hpp"
#include "calendar/lunar_calendar.hpp"
#include "core/logger.hpp"
#include "io/csv_export.hpp"
#include "search/grid_cache.hpp"
#include "search/grid_search.hpp"
#include "visibility/night_window.hpp"
#include "visibility/odeh_criterion.hpp"

#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace hilal;

namespace
{

// Set from the SIGINT handler, forwarded to the request's stop_source by a watcher thread
std::atomic<bool> g_interrupted{false};

void on_interrupt(int /*signal*/)
{
    g_interrupted.store(true);
}

std::optional<f64> parse_number(std::string_view text)
{
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<astro::Observer> parse_observer(std::string_view lat_text, std::string_view lon_text)
{
    const auto lat = parse_number(lat_text);
    const auto lon = parse_number(lon_text);
    if (!lat || !lon || *lat < -90.0 || *lat > 90.0)
    {
        HLL_ERROR("Invalid coordinates: '{}', '{}'", lat_text, lon_text);
        return std::nullopt;
    }
    return astro::Observer{.latitude_deg = *lat, .longitude_deg = *lon};
}

std::optional<astro::CalendarDate> parse_date_arg(std::string_view text)
{
    auto date = astro::TimeSystem::parse_date(text);
    if (!date)
    {
        HLL_ERROR("Invalid date '{}', expected YYYY-MM-DD", text);
    }
    return date;
}

void print_usage()
{
    std::cout << "Usage:\n"
              << "  hilal visibility <lat> <lon> <YYYY-MM-DD>\n"
              << "  hilal calendar <lat> <lon> <YYYY-MM-DD> [months] [out.csv]\n"
              << "  hilal grid <YYYY-MM-DD> <out.csv> [anchor_lat anchor_lon]\n"
              << "  hilal debug <YYYY-MM-DD> <points.csv> <out.csv>\n";
}

std::string optional_time(const visibility::VisibilityResult& result, f64 jd)
{
    return (jd > 0.0) ? fmt::format("{}  (local {})", astro::TimeSystem::format_iso(jd), result.local_time(jd))
                      : std::string("N/A");
}

// -----------------------------------------------------------------------
// visibility
// -----------------------------------------------------------------------
int run_visibility(const astro::Ephemeris& ephemeris, const std::vector<std::string_view>& args)
{
    if (args.size() < 3)
    {
        print_usage();
        return 2;
    }
    const auto observer = parse_observer(args[0], args[1]);
    const auto date = parse_date_arg(args[2]);
    if (!observer || !date)
    {
        return 2;
    }

    const auto conjunction = astro::nearest_conjunction(ephemeris, astro::TimeSystem::midnight_jd(*date));
    const auto result = visibility::classify_visibility(ephemeris, *observer, *date, conjunction);
    const auto night = visibility::compute_night_window(ephemeris, *observer, *date, conjunction);

    std::cout << fmt::format("Location:    {:.4f}, {:.4f} (UTC{:+d})\n",
                             result.observer.latitude_deg, result.observer.longitude_deg, result.tz_hours)
              << fmt::format("Evening of:  {}\n", astro::TimeSystem::format_date(*date))
              << fmt::format("Result:      {} - {}\n",
                             visibility::classification_code(result.classification),
                             visibility::classification_name(result.classification));
    if (result.v_value)
    {
        std::cout << fmt::format("V-value:     {:.4f}\n", *result.v_value)
                  << fmt::format("ARCV:        {:.4f} deg\n", result.arcv_deg)
                  << fmt::format("ARCL:        {:.4f} deg\n", result.elongation_deg)
                  << fmt::format("W:           {:.4f} arcmin (SD {:.3f})\n",
                                 result.crescent_width_arcmin, result.moon_semi_diameter_arcmin)
                  << fmt::format("Best time:   {}\n", optional_time(result, result.best_time));
    }
    std::cout << fmt::format("Sunset:      {}\n", optional_time(result, result.sunset))
              << fmt::format("Moonset:     {}\n", optional_time(result, result.moonset));
    if (result.moonset > 0.0)
    {
        std::cout << fmt::format("Lag:         {:.2f} min\n", result.lag_minutes);
    }
    if (conjunction)
    {
        std::cout << fmt::format("Conjunction: {}{}\n", astro::TimeSystem::format_iso(*conjunction),
                                 result.conjunction_triggered ? "  (after sunset)" : "");
    }
    if (night)
    {
        std::cout << fmt::format("Night:       {} .. {}{}\n",
                                 astro::TimeSystem::format_iso(night->night_start),
                                 astro::TimeSystem::format_iso(night->night_end),
                                 night->approximate ? "  (approximate)" : "");
    }
    if (result.failure_reason)
    {
        std::cout << fmt::format("Reason:      {}\n", *result.failure_reason);
    }
    return 0;
}

// -----------------------------------------------------------------------
// calendar
// -----------------------------------------------------------------------
int run_calendar(const astro::Ephemeris& ephemeris, const std::vector<std::string_view>& args)
{
    if (args.size() < 3)
    {
        print_usage();
        return 2;
    }
    const auto observer = parse_observer(args[0], args[1]);
    const auto date = parse_date_arg(args[2]);
    if (!observer || !date)
    {
        return 2;
    }

    calendar::CalendarConfig config;
    if (args.size() > 3)
    {
        const auto months = parse_number(args[3]);
        if (!months || *months < 1.0)
        {
            HLL_ERROR("Invalid month count '{}'", args[3]);
            return 2;
        }
        config.month_count = static_cast<i32>(*months);
    }

    std::stop_source stop_source;
    std::atomic<bool> finished{false};
    std::signal(SIGINT, on_interrupt);

    std::thread watcher([&] {
        while (!finished.load())
        {
            if (g_interrupted.load())
            {
                HLL_INFO("Interrupt received, cancelling...");
                stop_source.request_stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    i32 last_reported = -10;
    const auto on_progress = [&](const calendar::ProgressEvent& event) {
        const i32 percent = static_cast<i32>(event.percent);
        if (percent / 10 != last_reported / 10)
        {
            last_reported = percent;
            HLL_INFO("Progress: {}%", percent);
        }
    };

    const auto outcome = calendar::compute_lunar_calendar(
        ephemeris, *date, *observer, config, on_progress, stop_source.get_token());

    finished.store(true);
    watcher.join();
    std::signal(SIGINT, SIG_DFL);

    if (outcome.status != calendar::CalendarStatus::Completed || !outcome.calendar)
    {
        std::cout << fmt::format("Calendar {}: {}\n", calendar::calendar_status_name(outcome.status), outcome.reason);
        return outcome.status == calendar::CalendarStatus::Cancelled ? 130 : 1;
    }

    for (const auto& month : outcome.calendar->months)
    {
        std::cout << fmt::format("\n{} {} AH  (conjunction {})\n",
                                 month.month_name, month.hijri_year,
                                 astro::TimeSystem::format_iso(month.conjunction))
                  << fmt::format("  Night 1: {} via {}",
                                 astro::TimeSystem::format_date(month.night1.date),
                                 calendar::night1_method_name(month.night1.method));
        if (month.night1.method == calendar::Night1Method::SharedNightInheritance)
        {
            std::cout << fmt::format(" ({} donor cells)", month.night1.inherited_from_cells.size());
        }
        std::cout << fmt::format("\n  {} nights: {} .. {}\n",
                                 month.days.size(),
                                 month.days.empty() ? std::string("-") : astro::TimeSystem::format_date(month.days.front().date),
                                 month.days.empty() ? std::string("-") : astro::TimeSystem::format_date(month.days.back().date));
    }

    if (args.size() > 4 && !io::CsvExport::write_calendar_csv(std::string(args[4]), *outcome.calendar))
    {
        return 1;
    }
    return 0;
}

// -----------------------------------------------------------------------
// grid
// -----------------------------------------------------------------------
int run_grid(const astro::Ephemeris& ephemeris, const std::vector<std::string_view>& args)
{
    if (args.size() < 2)
    {
        print_usage();
        return 2;
    }
    const auto date = parse_date_arg(args[0]);
    if (!date)
    {
        return 2;
    }

    std::optional<astro::Observer> anchor;
    if (args.size() >= 4)
    {
        anchor = parse_observer(args[2], args[3]);
        if (!anchor)
        {
            return 2;
        }
    }

    const search::GridConfig config;
    search::GridCache cache;
    search::WorkerPool pool(search::WorkerPoolConfig{
        .worker_count = search::clamped_parallelism(config.min_workers, config.max_workers),
    });

    const auto grid = search::compute_full_grid(ephemeris, *date, anchor, pool, {}, config, &cache);
    if (!grid)
    {
        return 1;
    }

    if (grid->anchor)
    {
        const auto& summary = *grid->anchor;
        std::cout << fmt::format("Anchor cell {:.1f}, {:.1f}: {} earlier/same, {} later",
                                 summary.anchor_cell.latitude_deg, summary.anchor_cell.longitude_deg,
                                 summary.earlier_or_same.size(), summary.later.size());
        if (summary.max_shared_latitude)
        {
            std::cout << fmt::format(", busiest row {:.1f} ({} cells)",
                                     *summary.max_shared_latitude, summary.max_shared_count);
        }
        std::cout << "\n";
    }

    return io::CsvExport::write_grid_csv(std::string(args[1]), *grid) ? 0 : 1;
}

// -----------------------------------------------------------------------
// debug
// -----------------------------------------------------------------------
int run_debug(const astro::Ephemeris& ephemeris, const std::vector<std::string_view>& args)
{
    if (args.size() < 3)
    {
        print_usage();
        return 2;
    }
    const auto date = parse_date_arg(args[0]);
    if (!date)
    {
        return 2;
    }

    const auto points = io::CsvExport::load_points_csv(std::string(args[1]));
    if (!points)
    {
        return 1;
    }

    const auto conjunction = astro::nearest_conjunction(ephemeris, astro::TimeSystem::midnight_jd(*date));

    std::vector<visibility::VisibilityResult> results;
    results.reserve(points->size());
    for (const auto& point : *points)
    {
        results.push_back(visibility::classify_visibility(ephemeris, point.observer, *date, conjunction));
    }

    return io::CsvExport::write_debug_csv(std::string(args[2]), *points, results) ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    const std::vector<std::string_view> all_args(argv + 1, argv + argc);
    if (all_args.empty())
    {
        print_usage();
        core::Logger::shutdown();
        return 2;
    }

    const std::string_view command = all_args.front();
    const std::vector<std::string_view> args(all_args.begin() + 1, all_args.end());
    const astro::NovaEphemeris ephemeris{};

    int status = 2;
    if (command == "visibility")
    {
        status = run_visibility(ephemeris, args);
    }
    else if (command == "calendar")
    {
        status = run_calendar(ephemeris, args);
    }
    else if (command == "grid")
    {
        status = run_grid(ephemeris, args);
    }
    else if (command == "debug")
    {
        status = run_debug(ephemeris, args);
    }
    else
    {
        HLL_ERROR("Unknown command '{}'", command);
        print_usage();
    }

    core::Logger::shutdown();
    return status;
}
