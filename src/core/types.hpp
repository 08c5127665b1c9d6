#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstddef>
#include <cstdint>

namespace hilal
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;
    using usize = std::size_t;

    // Vector types (double precision for ephemeris work)
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi            = glm::pi<f64>();
        constexpr f64 kHalfPi        = kPi / 2.0;
        constexpr f64 kDegToRad      = kPi / 180.0;
        constexpr f64 kRadToDeg      = 180.0 / kPi;
        constexpr f64 kJ2000         = 2451545.0;     // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd   = 2440587.5;     // 1970-01-01 00:00 UTC
        constexpr f64 kAuKm          = 149597870.7;
        constexpr f64 kMoonRadiusKm  = 1737.4;
        constexpr f64 kSynodicMonth  = 29.530588861;  // Mean synodic month (days)
    }

    // Time constants (Julian Date arithmetic is in days)
    namespace time_constants
    {
        constexpr f64 kHoursPerDay   = 24.0;
        constexpr f64 kMinutesPerDay = 1440.0;
        constexpr f64 kSecondsPerDay = 86400.0;
        constexpr f64 kOneHour       = 1.0 / kHoursPerDay;
        constexpr f64 kOneMinute     = 1.0 / kMinutesPerDay;
        constexpr f64 kOneSecond     = 1.0 / kSecondsPerDay;
    }
}
