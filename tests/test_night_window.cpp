/// @file test_night_window.cpp
/// @brief Unit tests for hilal::visibility::compute_night_window.
///
/// Covers the normal twilight window and every fallback: sunrise when the
/// Sun never reaches −18°, the synthetic window for implausibly long
/// nights, and no window at all during polar day or night.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scripted_ephemeris.hpp"
#include "visibility/night_window.hpp"

using namespace hilal;
using namespace hilal::visibility;
using astro::CalendarDate;
using astro::Observer;
using test::Script;
using test::ScriptedEphemeris;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    hilal::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    hilal::core::Logger::shutdown();
    return result;
}

// =================================================================
// Fixtures
// =================================================================

static constexpr CalendarDate kEvening = {.year = 2024, .month = 3, .day = 11};
static constexpr Observer kGreenwich = {.latitude_deg = 0.0, .longitude_deg = 0.0};

static constexpr f64 kSunset = 2460381.25;           // 2024-03-11 18:00 UTC
static constexpr f64 kTwilightEnd = 2460381.3125;    // 19:30 UTC
static constexpr f64 kNextSunrise = 2460381.75;      // 2024-03-12 06:00 UTC
static constexpr f64 kJdEpsilon = 1e-12;

// =================================================================
// Astronomical twilight
// =================================================================

TEST_CASE("Night runs from sunset to the end of astronomical twilight")
{
    const ScriptedEphemeris ephemeris{};
    const auto window = compute_night_window(ephemeris, kGreenwich, kEvening);

    REQUIRE(window.has_value());
    CHECK(window->night_start == doctest::Approx(kSunset).epsilon(kJdEpsilon));
    CHECK(window->night_end == doctest::Approx(kTwilightEnd).epsilon(kJdEpsilon));
    CHECK(window->source == NightEndSource::AstronomicalTwilight);
    CHECK_FALSE(window->approximate);
    CHECK(window->duration_minutes() == doctest::Approx(90.0));
}

TEST_CASE("A known sunset is used as the window start")
{
    const ScriptedEphemeris ephemeris{};
    const f64 sunset = kSunset - 0.5 * time_constants::kOneHour;

    const auto window = compute_night_window(ephemeris, kGreenwich, kEvening, std::nullopt, sunset);

    REQUIRE(window.has_value());
    CHECK(window->night_start == doctest::Approx(sunset).epsilon(kJdEpsilon));
    CHECK(window->night_end == doctest::Approx(kTwilightEnd).epsilon(kJdEpsilon));
}

TEST_CASE("Conjunction does not change the window")
{
    const ScriptedEphemeris ephemeris{};
    const auto plain = compute_night_window(ephemeris, kGreenwich, kEvening);
    const auto with_conjunction = compute_night_window(ephemeris, kGreenwich, kEvening, kSunset + 0.1);

    REQUIRE(plain.has_value());
    REQUIRE(with_conjunction.has_value());
    CHECK(plain->night_start == doctest::Approx(with_conjunction->night_start).epsilon(kJdEpsilon));
    CHECK(plain->night_end == doctest::Approx(with_conjunction->night_end).epsilon(kJdEpsilon));
}

TEST_CASE("Window end is always after its start")
{
    const ScriptedEphemeris ephemeris{};

    for (f64 lon = -179.0; lon < 180.0; lon += 22.0)
    {
        const auto window = compute_night_window(ephemeris, {.latitude_deg = 30.0, .longitude_deg = lon}, kEvening);
        REQUIRE(window.has_value());
        CHECK(window->night_end > window->night_start);
    }
}

// =================================================================
// Sunrise fallback
// =================================================================

TEST_CASE("Without a twilight crossing the night ends at sunrise")
{
    Script script;
    script.twilight_hour.reset();

    const auto window = compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening);

    REQUIRE(window.has_value());
    CHECK(window->night_end == doctest::Approx(kNextSunrise).epsilon(kJdEpsilon));
    CHECK(window->source == NightEndSource::Sunrise);
    CHECK_FALSE(window->approximate);
}

TEST_CASE("A twilight crossing after the next sunrise is rejected")
{
    Script script;
    script.sunrise_hour = 4.0;
    script.twilight_hour = 5.0;   // within 12 h of sunset, but after the 04:00 sunrise

    const auto window = compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening);

    REQUIRE(window.has_value());
    CHECK(window->source == NightEndSource::Sunrise);
    CHECK(window->duration_minutes() == doctest::Approx(600.0));
}

TEST_CASE("Twilight is accepted when there is no sunrise at all")
{
    Script script;
    script.has_sunrise = false;

    const auto window = compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening);

    REQUIRE(window.has_value());
    CHECK(window->source == NightEndSource::AstronomicalTwilight);
}

// =================================================================
// Synthetic window
// =================================================================

TEST_CASE("A sunrise more than 20 hours away yields a 12-hour synthetic night")
{
    Script script;
    script.twilight_hour.reset();
    script.sunrise_hour = 16.0;   // 22 h after the 18:00 sunset

    const auto window = compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening);

    REQUIRE(window.has_value());
    CHECK(window->source == NightEndSource::Synthetic);
    CHECK(window->approximate);
    CHECK(window->night_start == doctest::Approx(kSunset).epsilon(kJdEpsilon));
    CHECK(window->duration_minutes() == doctest::Approx(720.0));
}

TEST_CASE("A sunrise just under 20 hours away is used as is")
{
    Script script;
    script.twilight_hour.reset();
    script.sunrise_hour = 13.5;   // 19.5 h after sunset

    const auto window = compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening);

    REQUIRE(window.has_value());
    CHECK(window->source == NightEndSource::Sunrise);
    CHECK(window->duration_minutes() == doctest::Approx(19.5 * 60.0));
}

// =================================================================
// No window
// =================================================================

TEST_CASE("No sunset means no night")
{
    Script script;
    script.has_sunset = false;

    CHECK_FALSE(compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening).has_value());
}

TEST_CASE("Neither twilight nor sunrise means no night")
{
    Script script;
    script.twilight_hour.reset();
    script.has_sunrise = false;

    CHECK_FALSE(compute_night_window(ScriptedEphemeris{script}, kGreenwich, kEvening).has_value());
}
