/// @file test_shared_night.cpp
/// @brief Unit tests for hilal::visibility::shared_night and relative_order.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "visibility/night_window.hpp"
#include "visibility/shared_night.hpp"

using namespace hilal;
using namespace hilal::visibility;

// =================================================================
// Helpers
// =================================================================

static constexpr f64 kMidnight = 2460381.5;   // 2024-03-12 00:00 UTC

/// Night window from clock hours relative to kMidnight; negative hours fall on the previous day.
static NightWindow window_hours(f64 start_hours, f64 end_hours)
{
    return NightWindow{
        .night_start = kMidnight + start_hours / time_constants::kHoursPerDay,
        .night_end   = kMidnight + end_hours / time_constants::kHoursPerDay,
    };
}

// =================================================================
// Overlap
// =================================================================

TEST_CASE("18:00–05:00 and 19:30–04:00 share 510 minutes")
{
    const NightWindow a = window_hours(-6.0, 5.0);
    const NightWindow b = window_hours(-4.5, 4.0);

    const SharedNightResult shared = shared_night(a, b);

    CHECK(shared.overlaps);
    CHECK(shared.overlap_minutes == doctest::Approx(510.0));
}

TEST_CASE("Overlap is commutative")
{
    const NightWindow a = window_hours(-6.0, -4.5);
    const NightWindow b = window_hours(-5.0, 1.0);

    CHECK(shared_night(a, b) == shared_night(b, a));
    CHECK(shared_night(a, b).overlap_minutes == doctest::Approx(30.0));
}

TEST_CASE("Identical windows overlap fully")
{
    const NightWindow a = window_hours(-6.0, -4.5);
    const SharedNightResult shared = shared_night(a, a);

    CHECK(shared.overlaps);
    CHECK(shared.overlap_minutes == doctest::Approx(a.duration_minutes()));
}

TEST_CASE("Disjoint windows do not overlap")
{
    const NightWindow a = window_hours(-6.0, -4.5);
    const NightWindow b = window_hours(-2.0, -0.5);

    const SharedNightResult shared = shared_night(a, b);

    CHECK_FALSE(shared.overlaps);
    CHECK(shared.overlap_minutes == 0.0);
    CHECK(shared_night(b, a) == shared);
}

TEST_CASE("Windows that only touch do not overlap")
{
    const NightWindow a = window_hours(-6.0, -4.5);
    const NightWindow b = window_hours(-4.5, -3.0);

    CHECK_FALSE(shared_night(a, b).overlaps);
    CHECK_FALSE(shared_night(b, a).overlaps);
}

TEST_CASE("A window inside another overlaps for its own length")
{
    const NightWindow outer = window_hours(-6.0, 6.0);
    const NightWindow inner = window_hours(-1.0, 1.0);

    CHECK(shared_night(outer, inner).overlap_minutes == doctest::Approx(120.0));
}

// =================================================================
// Sunset order
// =================================================================

TEST_CASE("Sunset order relative to a reference window")
{
    const NightWindow reference = window_hours(-6.0, -4.5);

    CHECK(relative_order(reference, window_hours(-7.0, -5.0)) == SunsetOrder::EarlierOrSame);
    CHECK(relative_order(reference, window_hours(-6.0, -4.0)) == SunsetOrder::EarlierOrSame);
    CHECK(relative_order(reference, window_hours(-5.5, -4.0)) == SunsetOrder::Later);
}

TEST_CASE("Order is antisymmetric for distinct sunsets")
{
    const NightWindow east = window_hours(-7.0, -5.5);
    const NightWindow west = window_hours(-5.0, -3.5);

    CHECK(relative_order(east, west) == SunsetOrder::Later);
    CHECK(relative_order(west, east) == SunsetOrder::EarlierOrSame);
}
