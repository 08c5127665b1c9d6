/// @file test_odeh_criterion.cpp
/// @brief Unit tests for hilal::visibility::classify_visibility and the Odeh zones.
///
/// Geometry comes from a scripted ephemeris: sunset 18:00 UTC daily and a
/// new moon on 2024-03-10 09:00 UTC, so every quantity can be derived by hand.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "scripted_ephemeris.hpp"
#include "visibility/odeh_criterion.hpp"

#include <cmath>

using namespace hilal;
using namespace hilal::visibility;
using astro::CalendarDate;
using astro::Observer;
using astro::TimeSystem;
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

static constexpr CalendarDate kFirstEvening = {.year = 2024, .month = 3, .day = 10};
static constexpr CalendarDate kSecondEvening = {.year = 2024, .month = 3, .day = 11};
static constexpr Observer kGreenwich = {.latitude_deg = 0.0, .longitude_deg = 0.0};

/// 18:00 UTC on 2024-03-11
static constexpr f64 kSecondSunset = 2460381.25;

/// Relative tolerance for Julian Dates: ~0.2 s
static constexpr f64 kJdEpsilon = 1e-12;

// =================================================================
// Zone thresholds
// =================================================================

TEST_CASE("Zone boundaries belong to the higher zone")
{
    CHECK(classify_v(5.65) == Classification::EasilyVisible);
    CHECK(classify_v(5.6499) == Classification::VisibleUnderPerfectConditions);
    CHECK(classify_v(2.0) == Classification::VisibleUnderPerfectConditions);
    CHECK(classify_v(1.9999) == Classification::VisibleWithOpticalAid);
    CHECK(classify_v(-0.96) == Classification::VisibleWithOpticalAid);
    CHECK(classify_v(-0.9601) == Classification::NotVisible);
    CHECK(classify_v(-50.0) == Classification::NotVisible);
    CHECK(classify_v(50.0) == Classification::EasilyVisible);
}

TEST_CASE("Odeh limit polynomial")
{
    CHECK(odeh_limit(0.0) == doctest::Approx(7.1651));
    CHECK(odeh_limit(1.0) == doctest::Approx(-0.1018 + 0.7319 - 6.3226 + 7.1651));
}

TEST_CASE("Odeh limit falls as the crescent widens")
{
    for (f64 w = 0.0; w < 5.0; w += 0.05)
    {
        CHECK(odeh_limit(w + 0.05) < odeh_limit(w));
    }
}

TEST_CASE("Classification codes and names")
{
    CHECK(classification_code(Classification::EasilyVisible) == "EV");
    CHECK(classification_code(Classification::VisibleUnderPerfectConditions) == "VP");
    CHECK(classification_code(Classification::VisibleWithOpticalAid) == "VO");
    CHECK(classification_code(Classification::NotVisible) == "NV");
    CHECK(classification_code(Classification::Impossible) == "I");
    CHECK(classification_code(Classification::Undetermined) == "U");
    CHECK(classification_name(Classification::VisibleWithOpticalAid) == "Visible With Optical Aid");

    CHECK(is_visible(Classification::EasilyVisible));
    CHECK(is_visible(Classification::VisibleUnderPerfectConditions));
    CHECK(is_visible(Classification::VisibleWithOpticalAid));
    CHECK_FALSE(is_visible(Classification::NotVisible));
    CHECK_FALSE(is_visible(Classification::Impossible));
    CHECK_FALSE(is_visible(Classification::Undetermined));
}

// =================================================================
// Evening geometry
// =================================================================

TEST_CASE("Evening geometry follows the Odeh procedure")
{
    const ScriptedEphemeris ephemeris{};
    const auto result = classify_visibility(ephemeris, kGreenwich, kSecondEvening, test::kScriptEpochJd);

    // Moon is 1.375 days old at sunset: 66 minutes of lag
    CHECK(result.sunset == doctest::Approx(kSecondSunset).epsilon(kJdEpsilon));
    CHECK(result.lag_minutes == doctest::Approx(66.0));
    CHECK(result.moonset == doctest::Approx(kSecondSunset + 66.0 / 1440.0).epsilon(kJdEpsilon));

    const f64 best_time = kSecondSunset + (4.0 / 9.0) * 66.0 / 1440.0;
    CHECK(result.best_time == doctest::Approx(best_time).epsilon(kJdEpsilon));

    const f64 age = ephemeris.moon_age(best_time);
    CHECK(result.arcv_deg == doctest::Approx(5.0 * age));
    CHECK(result.elongation_deg == doctest::Approx(ephemeris.elongation(best_time)));

    const f64 sd = astro_constants::kMoonRadiusKm / 384400.0 * astro_constants::kRadToDeg * 60.0;
    CHECK(result.moon_semi_diameter_arcmin == doctest::Approx(sd));
    CHECK(result.crescent_width_arcmin
          == doctest::Approx(sd * (1.0 - std::cos(result.elongation_deg * astro_constants::kDegToRad))));

    REQUIRE(result.v_value.has_value());
    CHECK(*result.v_value == doctest::Approx(result.arcv_deg - odeh_limit(result.crescent_width_arcmin)));
    CHECK(result.classification == Classification::VisibleUnderPerfectConditions);
    CHECK_FALSE(result.conjunction_triggered);
    CHECK_FALSE(result.failure_reason.has_value());
}

TEST_CASE("A few hours after conjunction the crescent is not visible")
{
    const ScriptedEphemeris ephemeris{};
    const auto result = classify_visibility(ephemeris, kGreenwich, kFirstEvening, test::kScriptEpochJd);

    CHECK(result.classification == Classification::NotVisible);
    REQUIRE(result.v_value.has_value());
    CHECK(*result.v_value < -0.96);
}

TEST_CASE("Raising the Moon raises V by the same amount")
{
    Script higher;
    higher.arcv_bonus_deg = [](const Observer&) { return 1.0; };

    const auto base = classify_visibility(ScriptedEphemeris{}, kGreenwich, kSecondEvening);
    const auto raised = classify_visibility(ScriptedEphemeris{higher}, kGreenwich, kSecondEvening);

    REQUIRE(base.v_value.has_value());
    REQUIRE(raised.v_value.has_value());
    CHECK(*raised.v_value == doctest::Approx(*base.v_value + 1.0));
    CHECK(raised.classification == Classification::VisibleUnderPerfectConditions);

    higher.arcv_bonus_deg = [](const Observer&) { return 10.0; };
    const auto easy = classify_visibility(ScriptedEphemeris{higher}, kGreenwich, kSecondEvening);
    CHECK(easy.classification == Classification::EasilyVisible);
}

TEST_CASE("Evening is read in the longitude timezone")
{
    const ScriptedEphemeris ephemeris{};

    // UTC+3: local noon 09:00 UTC, sunset the same UTC day
    const auto east = classify_visibility(ephemeris, {.latitude_deg = 21.4, .longitude_deg = 39.8}, kSecondEvening);
    CHECK(east.tz_hours == 3);
    CHECK(east.sunset == doctest::Approx(kSecondSunset).epsilon(kJdEpsilon));

    // UTC−7: local noon 19:00 UTC, so the first sunset is the next UTC day
    const auto west = classify_visibility(ephemeris, {.latitude_deg = 40.0, .longitude_deg = -100.0}, kSecondEvening);
    CHECK(west.tz_hours == -7);
    CHECK(west.sunset == doctest::Approx(kSecondSunset + 1.0).epsilon(kJdEpsilon));
}

TEST_CASE("Observer longitude is normalized before use")
{
    const ScriptedEphemeris ephemeris{};
    const auto result = classify_visibility(ephemeris, {.latitude_deg = 21.4, .longitude_deg = 399.8}, kSecondEvening);

    CHECK(result.observer.longitude_deg == doctest::Approx(39.8));
    CHECK(result.tz_hours == 3);
}

TEST_CASE("Local time carries the longitude timezone")
{
    const ScriptedEphemeris ephemeris{};

    const auto east = classify_visibility(ephemeris, {.latitude_deg = 21.4, .longitude_deg = 39.8}, kSecondEvening);
    CHECK(east.local_time(east.sunset) == "2024-03-11T21:00:00+03");

    const auto west = classify_visibility(ephemeris, {.latitude_deg = 40.0, .longitude_deg = -100.0}, kSecondEvening);
    CHECK(west.local_time(west.sunset) == "2024-03-12T11:00:00-07");

    CHECK(local_midnight_jd(kSecondEvening, 3) == doctest::Approx(TimeSystem::midnight_jd(kSecondEvening) - 0.125).epsilon(kJdEpsilon));
}

// =================================================================
// Impossible
// =================================================================

TEST_CASE("Moon setting before the Sun is Impossible")
{
    Script script;
    script.lag_minutes = [](f64) { return -5.0; };

    const auto result = classify_visibility(ScriptedEphemeris{script}, kGreenwich, kSecondEvening);

    CHECK(result.classification == Classification::Impossible);
    CHECK(result.lag_minutes == doctest::Approx(-5.0));
    CHECK_FALSE(result.v_value.has_value());
    CHECK_FALSE(result.conjunction_triggered);
    CHECK(result.failure_reason == "Moon sets before or at sunset");
}

TEST_CASE("Moon setting exactly at sunset is Impossible")
{
    Script script;
    script.lag_minutes = [](f64) { return 0.0; };

    const auto result = classify_visibility(ScriptedEphemeris{script}, kGreenwich, kSecondEvening);
    CHECK(result.classification == Classification::Impossible);
}

TEST_CASE("Conjunction between sunset and the next sunrise is Impossible")
{
    // Bright enough to be EV were it not for the conjunction
    Script script;
    script.arcv_deg = [](f64 age) { return 5.0 * age + 10.0; };
    const ScriptedEphemeris ephemeris{script};

    const auto unblocked = classify_visibility(ephemeris, kGreenwich, kSecondEvening);
    REQUIRE(unblocked.v_value.has_value());
    CHECK(*unblocked.v_value >= 5.65);
    CHECK(unblocked.classification == Classification::EasilyVisible);

    const f64 conjunction = kSecondSunset + 3.0 * time_constants::kOneHour;

    const auto result = classify_visibility(ephemeris, kGreenwich, kSecondEvening, conjunction);

    CHECK(result.classification == Classification::Impossible);
    CHECK(result.conjunction_triggered);
    CHECK_FALSE(result.v_value.has_value());
    CHECK(result.failure_reason == "Conjunction occurs after sunset");
    REQUIRE(result.conjunction.has_value());
    CHECK(*result.conjunction == doctest::Approx(conjunction).epsilon(kJdEpsilon));
}

TEST_CASE("Conjunction after the next sunrise does not block the evening")
{
    const ScriptedEphemeris ephemeris{};
    const f64 conjunction = kSecondSunset + 14.0 * time_constants::kOneHour;

    const auto result = classify_visibility(ephemeris, kGreenwich, kSecondEvening, conjunction);

    CHECK_FALSE(result.conjunction_triggered);
    CHECK(result.v_value.has_value());
}

TEST_CASE("Conjunction with no next sunrise is Impossible")
{
    Script script;
    script.has_sunrise = false;

    const auto result = classify_visibility(
        ScriptedEphemeris{script}, kGreenwich, kSecondEvening, kSecondSunset + 30.0 * time_constants::kOneHour);

    CHECK(result.classification == Classification::Impossible);
    CHECK(result.conjunction_triggered);
}

TEST_CASE("Negative lag takes precedence over a later conjunction")
{
    Script script;
    script.lag_minutes = [](f64) { return -1.0; };

    const auto result = classify_visibility(
        ScriptedEphemeris{script}, kGreenwich, kSecondEvening, kSecondSunset + time_constants::kOneHour);

    CHECK(result.classification == Classification::Impossible);
    CHECK_FALSE(result.conjunction_triggered);
    CHECK(result.failure_reason == "Moon sets before or at sunset");
}

// =================================================================
// Undetermined
// =================================================================

TEST_CASE("No sunset gives Undetermined")
{
    Script script;
    script.has_sunset = false;

    const auto result = classify_visibility(ScriptedEphemeris{script}, kGreenwich, kSecondEvening);

    CHECK(result.classification == Classification::Undetermined);
    CHECK_FALSE(result.v_value.has_value());
    CHECK(result.failure_reason == "No sunset found");
}

TEST_CASE("No moonset within two days gives Undetermined")
{
    Script script;
    script.lag_minutes = [](f64) { return 5000.0; };

    const auto result = classify_visibility(ScriptedEphemeris{script}, kGreenwich, kSecondEvening);

    CHECK(result.classification == Classification::Undetermined);
    CHECK(result.sunset == doctest::Approx(kSecondSunset).epsilon(kJdEpsilon));
    CHECK(result.failure_reason == "No moonset found");
}

TEST_CASE("Ephemeris failure gives Undetermined instead of throwing")
{
    Script script;
    script.throw_on_altitude = true;

    VisibilityResult result;
    CHECK_NOTHROW(result = classify_visibility(ScriptedEphemeris{script}, kGreenwich, kSecondEvening));

    CHECK(result.classification == Classification::Undetermined);
    CHECK_FALSE(result.v_value.has_value());
    CHECK(result.failure_reason == "scripted altitude failure");
}
