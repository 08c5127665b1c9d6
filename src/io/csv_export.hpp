#pragma once

/// @file csv_export.hpp
/// @brief CSV output of grids, calendars and per-point debug tables; CSV input of test points.

#include "astro/coordinates.hpp"
#include "calendar/lunar_calendar.hpp"
#include "core/types.hpp"
#include "search/grid_search.hpp"
#include "visibility/odeh_criterion.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace hilal::io
{
    /// @brief A named location read from a points file.
    struct TestPoint
    {
        std::string name;
        astro::Observer observer;
    };

    /// @brief Static utility class for reading and writing CSV files.
    ///
    /// Writers have a stream form (used by tests and stdout) and a path form
    /// that logs and returns false when the file cannot be written.
    class CsvExport
    {
    public:
        CsvExport() = delete;

        /// @brief Load test points from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   name, lat, lon
        ///
        /// Malformed lines are skipped with a warning.
        /// @return Points on success, std::nullopt if the file is unreadable or holds none.
        [[nodiscard]] static std::optional<std::vector<TestPoint>>
            load_points_csv(const std::filesystem::path& path);

        /// @brief One row per lattice cell.
        static void write_grid(std::ostream& out, const search::FullGridResult& grid);
        [[nodiscard]] static bool write_grid_csv(const std::filesystem::path& path,
                                                 const search::FullGridResult& grid);

        /// @brief One row per night of every month.
        static void write_calendar(std::ostream& out, const calendar::CalendarResult& lunar_calendar);
        [[nodiscard]] static bool write_calendar_csv(const std::filesystem::path& path,
                                                     const calendar::CalendarResult& lunar_calendar);

        /// @brief Full diagnostics for each point; @p results[i] belongs to @p points[i].
        static void write_debug(std::ostream& out,
                                const std::vector<TestPoint>& points,
                                const std::vector<visibility::VisibilityResult>& results);
        [[nodiscard]] static bool write_debug_csv(const std::filesystem::path& path,
                                                  const std::vector<TestPoint>& points,
                                                  const std::vector<visibility::VisibilityResult>& results);

        /// @brief Quote a field when it contains a comma, quote or newline.
        [[nodiscard]] static std::string escape(std::string_view field);

    private:
        [[nodiscard]] static std::string_view trim(std::string_view sv);
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace hilal::io
