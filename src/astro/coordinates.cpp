/// @file coordinates.cpp
/// @brief Implementation of observer helpers and angular arithmetic.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <cmath>

namespace hilal::astro
{

// -----------------------------------------------------------------
// Observer
// -----------------------------------------------------------------

Observer Observer::normalized() const
{
    return Observer{
        .latitude_deg  = latitude_deg,
        .longitude_deg = Coordinates::normalize_longitude_deg(longitude_deg),
    };
}

EquatorialCoord Coordinates::equatorial_from_degrees(f64 ra_deg, f64 dec_deg)
{
    return EquatorialCoord{
        .ra  = normalize_degrees(ra_deg) * astro_constants::kDegToRad,
        .dec = dec_deg * astro_constants::kDegToRad,
    };
}

// -----------------------------------------------------------------
// Angular separation via unit vectors.
// The dot product loses precision near zero separation, so the
// angle is taken from atan2(|a × b|, a · b) instead of acos.
// -----------------------------------------------------------------

f64 Coordinates::angular_separation(const EquatorialCoord& a, const EquatorialCoord& b)
{
    const Vec3d va{std::cos(a.dec) * std::cos(a.ra), std::cos(a.dec) * std::sin(a.ra), std::sin(a.dec)};
    const Vec3d vb{std::cos(b.dec) * std::cos(b.ra), std::cos(b.dec) * std::sin(b.ra), std::sin(b.dec)};

    return std::atan2(glm::length(glm::cross(va, vb)), glm::dot(va, vb));
}

// -----------------------------------------------------------------
// Longitude helpers
// -----------------------------------------------------------------

f64 Coordinates::normalize_longitude_deg(f64 lon_deg)
{
    f64 normalized = std::fmod(lon_deg + 180.0, 360.0) - 180.0;
    if (normalized < -180.0)
    {
        normalized += 360.0;
    }
    if (normalized >= 180.0)
    {
        normalized -= 360.0;
    }
    return normalized;
}

i32 Coordinates::longitude_timezone_hours(f64 lon_deg)
{
    // std::round already rounds halves away from zero: -0.5 → -1
    return static_cast<i32>(std::round(lon_deg / 15.0));
}

// -----------------------------------------------------------------
// Angle normalization
// -----------------------------------------------------------------

f64 Coordinates::normalize_degrees(f64 angle_deg)
{
    angle_deg = std::fmod(angle_deg, 360.0);
    if (angle_deg < 0.0)
    {
        angle_deg += 360.0;
    }
    return angle_deg;
}

} // namespace hilal::astro
