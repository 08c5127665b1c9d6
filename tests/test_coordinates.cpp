/// @file test_coordinates.cpp
/// @brief Unit tests for hilal::astro::Coordinates and Observer.
///
/// Verifies angular separation and the longitude/timezone rules used to
/// read a calendar date as a local evening.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace hilal;
using namespace hilal::astro;

// =================================================================
// Degree input
// =================================================================

TEST_CASE("equatorial_from_degrees converts to radians and wraps RA")
{
    const EquatorialCoord a = Coordinates::equatorial_from_degrees(90.0, -23.44);
    CHECK(a.ra == doctest::Approx(astro_constants::kHalfPi));
    CHECK(a.dec == doctest::Approx(-23.44 * astro_constants::kDegToRad));

    const EquatorialCoord b = Coordinates::equatorial_from_degrees(-15.0, 0.0);
    CHECK(b.ra == doctest::Approx(345.0 * astro_constants::kDegToRad));
}

TEST_CASE("Elongation across the RA wrap is measured the short way")
{
    const EquatorialCoord moon = Coordinates::equatorial_from_degrees(355.0, 2.0);
    const EquatorialCoord sun = Coordinates::equatorial_from_degrees(3.0, 0.0);

    const f64 separation_deg = Coordinates::angular_separation(moon, sun) * astro_constants::kRadToDeg;
    CHECK(separation_deg > 8.0);
    CHECK(separation_deg < 8.5);
}

TEST_CASE("normalize_degrees folds into [0, 360)")
{
    CHECK(Coordinates::normalize_degrees(0.0) == doctest::Approx(0.0));
    CHECK(Coordinates::normalize_degrees(360.0) == doctest::Approx(0.0));
    CHECK(Coordinates::normalize_degrees(-10.0) == doctest::Approx(350.0));
    CHECK(Coordinates::normalize_degrees(725.0) == doctest::Approx(5.0));
}

// =================================================================
// Angular separation
// =================================================================

TEST_CASE("Angular separation of identical points is zero")
{
    const EquatorialCoord a = {.ra = 1.2, .dec = 0.3};
    CHECK(Coordinates::angular_separation(a, a) == doctest::Approx(0.0));
}

TEST_CASE("Angular separation along the equator equals the RA difference")
{
    const EquatorialCoord a = {.ra = 0.0, .dec = 0.0};
    const EquatorialCoord b = {.ra = 12.0 * astro_constants::kDegToRad, .dec = 0.0};

    CHECK(Coordinates::angular_separation(a, b) == doctest::Approx(12.0 * astro_constants::kDegToRad));
    CHECK(Coordinates::angular_separation(b, a) == doctest::Approx(12.0 * astro_constants::kDegToRad));
}

TEST_CASE("Angular separation between the poles is π")
{
    const EquatorialCoord north = {.ra = 0.0, .dec = astro_constants::kHalfPi};
    const EquatorialCoord south = {.ra = 0.0, .dec = -astro_constants::kHalfPi};
    CHECK(Coordinates::angular_separation(north, south) == doctest::Approx(astro_constants::kPi));
}

// =================================================================
// Longitude normalization
// =================================================================

TEST_CASE("normalize_longitude_deg folds into [-180, 180)")
{
    CHECK(Coordinates::normalize_longitude_deg(0.0) == doctest::Approx(0.0));
    CHECK(Coordinates::normalize_longitude_deg(180.0) == doctest::Approx(-180.0));
    CHECK(Coordinates::normalize_longitude_deg(-180.0) == doctest::Approx(-180.0));
    CHECK(Coordinates::normalize_longitude_deg(190.0) == doctest::Approx(-170.0));
    CHECK(Coordinates::normalize_longitude_deg(-190.0) == doctest::Approx(170.0));
    CHECK(Coordinates::normalize_longitude_deg(360.0) == doctest::Approx(0.0));
    CHECK(Coordinates::normalize_longitude_deg(540.0) == doctest::Approx(-180.0));
    CHECK(Coordinates::normalize_longitude_deg(-721.5) == doctest::Approx(-1.5));
}

TEST_CASE("normalize_longitude_deg is idempotent and stays in range")
{
    for (f64 lon = -1000.0; lon <= 1000.0; lon += 17.25)
    {
        const f64 once = Coordinates::normalize_longitude_deg(lon);
        CHECK(once >= -180.0);
        CHECK(once < 180.0);
        CHECK(Coordinates::normalize_longitude_deg(once) == doctest::Approx(once));
    }
}

TEST_CASE("Observer::normalized keeps latitude and folds longitude")
{
    const Observer raw = {.latitude_deg = 21.4, .longitude_deg = 399.8};
    const Observer normalized = raw.normalized();

    CHECK(normalized.latitude_deg == doctest::Approx(21.4));
    CHECK(normalized.longitude_deg == doctest::Approx(39.8));
}

// =================================================================
// Longitude-derived timezone
// =================================================================

TEST_CASE("Timezone is longitude / 15 rounded half away from zero")
{
    CHECK(Coordinates::longitude_timezone_hours(0.0) == 0);
    CHECK(Coordinates::longitude_timezone_hours(7.4) == 0);
    CHECK(Coordinates::longitude_timezone_hours(7.5) == 1);
    CHECK(Coordinates::longitude_timezone_hours(-7.5) == -1);
    CHECK(Coordinates::longitude_timezone_hours(39.8) == 3);
    CHECK(Coordinates::longitude_timezone_hours(-74.0) == -5);
    CHECK(Coordinates::longitude_timezone_hours(-180.0) == -12);
    CHECK(Coordinates::longitude_timezone_hours(179.0) == 12);
}
