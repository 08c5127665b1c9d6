/// @file csv_export.cpp
/// @brief Implementation of the CSV readers and writers.

#include "io/csv_export.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace hilal::io
{

namespace
{

std::string instant_field(f64 jd)
{
    return (jd > 0.0) ? astro::TimeSystem::format_iso(jd) : std::string{};
}

std::string instant_field(const std::optional<f64>& jd)
{
    return jd ? instant_field(*jd) : std::string{};
}

std::string number_field(const std::optional<f64>& value, i32 decimals = 4)
{
    return value ? fmt::format("{:.{}f}", *value, decimals) : std::string{};
}

std::string_view night_source_name(visibility::NightEndSource source)
{
    switch (source)
    {
        case visibility::NightEndSource::AstronomicalTwilight: return "twilight";
        case visibility::NightEndSource::Sunrise:              return "sunrise";
        case visibility::NightEndSource::Synthetic:            return "synthetic";
    }
    return "twilight";
}

// Geometry fields are only meaningful once the optical criterion has run
bool has_geometry(const visibility::VisibilityResult& result)
{
    return result.v_value.has_value();
}

template <typename Writer>
bool write_file(const std::filesystem::path& path, std::string_view what, Writer writer)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        HLL_CORE_ERROR("CsvExport: Failed to open {} for writing: {}", what, path.string());
        return false;
    }

    writer(file);
    file.flush();
    if (!file)
    {
        HLL_CORE_ERROR("CsvExport: Write error on {}: {}", what, path.string());
        return false;
    }

    HLL_CORE_INFO("CsvExport: Wrote {} to {}", what, path.string());
    return true;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load test points CSV: name,lat,lon
// -----------------------------------------------------------------

std::optional<std::vector<TestPoint>> CsvExport::load_points_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        HLL_CORE_ERROR("CsvExport: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        HLL_CORE_ERROR("CsvExport: File is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<TestPoint> points;
    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        std::istringstream stream(line);
        std::string name_str;
        std::string lat_str;
        std::string lon_str;

        if (!std::getline(stream, name_str, ',') ||
            !std::getline(stream, lat_str, ',') ||
            !std::getline(stream, lon_str))
        {
            HLL_CORE_WARN("CsvExport: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto lat = parse_f64(trim(lat_str));
        const auto lon = parse_f64(trim(lon_str));

        if (!lat || !lon || *lat < -90.0 || *lat > 90.0)
        {
            HLL_CORE_WARN("CsvExport: Failed to parse values on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        points.push_back(TestPoint{
            .name = std::string(trim(name_str)),
            .observer = astro::Observer{.latitude_deg = *lat, .longitude_deg = *lon},
        });
    }

    if (points.empty())
    {
        HLL_CORE_ERROR("CsvExport: No valid points found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        HLL_CORE_WARN("CsvExport: Skipped {} malformed lines", skipped);
    }

    HLL_CORE_INFO("CsvExport: Loaded {} points from {}", points.size(), path.string());
    return points;
}

// -----------------------------------------------------------------
// Grid
// -----------------------------------------------------------------

void CsvExport::write_grid(std::ostream& out, const search::FullGridResult& grid)
{
    out << "lat,lon,code,v,tz_hours,sunset_utc,moonset_utc,best_time_utc,arcv,w,lag_min,"
           "conjunction_triggered,night_start,night_end,night_source,shared_overlap_min,reason\n";

    for (const auto& cell : grid.cells)
    {
        const auto& vis = cell.visibility;
        const bool geometry = has_geometry(vis);

        out << fmt::format("{:.1f},{:.1f},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                           cell.observer.latitude_deg,
                           cell.observer.longitude_deg,
                           visibility::classification_code(vis.classification),
                           number_field(vis.v_value),
                           vis.tz_hours,
                           instant_field(vis.sunset),
                           instant_field(vis.moonset),
                           geometry ? instant_field(vis.best_time) : std::string{},
                           geometry ? number_field(vis.arcv_deg) : std::string{},
                           geometry ? number_field(vis.crescent_width_arcmin) : std::string{},
                           (vis.moonset > 0.0) ? number_field(vis.lag_minutes, 2) : std::string{},
                           vis.conjunction_triggered ? 1 : 0,
                           cell.night_window ? instant_field(cell.night_window->night_start) : std::string{},
                           cell.night_window ? instant_field(cell.night_window->night_end) : std::string{},
                           cell.night_window ? night_source_name(cell.night_window->source) : std::string_view{},
                           (cell.shared_night && cell.shared_night->overlaps)
                               ? number_field(cell.shared_night->overlap_minutes, 1) : std::string{},
                           escape(vis.failure_reason.value_or("")));
    }
}

bool CsvExport::write_grid_csv(const std::filesystem::path& path, const search::FullGridResult& grid)
{
    return write_file(path, "grid", [&](std::ostream& out) { write_grid(out, grid); });
}

// -----------------------------------------------------------------
// Calendar
// -----------------------------------------------------------------

void CsvExport::write_calendar(std::ostream& out, const calendar::CalendarResult& lunar_calendar)
{
    out << "month,month_name,hijri_year,night,date,night1_method,conjunction,next_conjunction\n";

    for (usize i = 0; i < lunar_calendar.months.size(); ++i)
    {
        const auto& month = lunar_calendar.months[i];
        for (const auto& day : month.days)
        {
            out << fmt::format("{},{},{},{},{},{},{},{}\n",
                               i + 1,
                               escape(month.month_name),
                               month.hijri_year,
                               day.night_number,
                               astro::TimeSystem::format_date(day.date),
                               calendar::night1_method_name(month.night1.method),
                               instant_field(month.conjunction),
                               instant_field(month.next_conjunction));
        }
    }
}

bool CsvExport::write_calendar_csv(const std::filesystem::path& path, const calendar::CalendarResult& lunar_calendar)
{
    return write_file(path, "calendar", [&](std::ostream& out) { write_calendar(out, lunar_calendar); });
}

// -----------------------------------------------------------------
// Debug table
// -----------------------------------------------------------------

void CsvExport::write_debug(std::ostream& out,
                            const std::vector<TestPoint>& points,
                            const std::vector<visibility::VisibilityResult>& results)
{
    out << "name,lat,lon,normalized_lon,tz_hours,code,zone,v,sunset_utc,sunset_local,"
           "moonset_utc,moonset_local,best_time_utc,best_time_local,conjunction,"
           "conjunction_triggered,arcv,w,lag_min,reason\n";

    const usize count = std::min(points.size(), results.size());
    for (usize i = 0; i < count; ++i)
    {
        const auto& point = points[i];
        const auto& vis = results[i];
        const bool geometry = has_geometry(vis);

        out << fmt::format("{},{:.4f},{:.4f},{:.4f},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                           escape(point.name),
                           point.observer.latitude_deg,
                           point.observer.longitude_deg,
                           vis.observer.longitude_deg,
                           vis.tz_hours,
                           visibility::classification_code(vis.classification),
                           escape(visibility::classification_name(vis.classification)),
                           number_field(vis.v_value),
                           instant_field(vis.sunset),
                           (vis.sunset > 0.0) ? vis.local_time(vis.sunset) : std::string{},
                           instant_field(vis.moonset),
                           (vis.moonset > 0.0) ? vis.local_time(vis.moonset) : std::string{},
                           geometry ? instant_field(vis.best_time) : std::string{},
                           geometry ? vis.local_time(vis.best_time) : std::string{},
                           instant_field(vis.conjunction),
                           vis.conjunction_triggered ? 1 : 0,
                           geometry ? number_field(vis.arcv_deg) : std::string{},
                           geometry ? number_field(vis.crescent_width_arcmin) : std::string{},
                           (vis.moonset > 0.0) ? number_field(vis.lag_minutes, 2) : std::string{},
                           escape(vis.failure_reason.value_or("")));
    }
}

bool CsvExport::write_debug_csv(const std::filesystem::path& path,
                                const std::vector<TestPoint>& points,
                                const std::vector<visibility::VisibilityResult>& results)
{
    return write_file(path, "debug table", [&](std::ostream& out) { write_debug(out, points, results); });
}

// -----------------------------------------------------------------
// Utilities
// -----------------------------------------------------------------

std::string CsvExport::escape(std::string_view field)
{
    if (field.find_first_of(",\"\n") == std::string_view::npos)
    {
        return std::string(field);
    }

    std::string quoted = "\"";
    for (const char c : field)
    {
        if (c == '"')
        {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string_view CsvExport::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<f64> CsvExport::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace hilal::io
