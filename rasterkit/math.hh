// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_MATH_HH
#define RASTERKIT_RASTERKIT_MATH_HH

#include <defs.hh>

#include <cmath>
#include <cstdint>

#include <rasterkit/types.hh>

namespace rasterkit {

inline int floor_of (double x) {
    return int (std::floor (x));
}

inline int ceil_of (double x) {
    return int (std::ceil (x));
}

//
// Round half up: 2.5 goes to 3 and -2.5 goes to -2. Every rasterizer rounds
// sample coordinates with this one rule so that the line, curve and clip
// paths agree on which pixel a half-way sample lands in. std::round would
// take -2.5 to -3, and nearbyint rounds halves to even.
//
inline int round_of (double x) {
    return int (std::floor (x + 0.5));
}

inline pointi_t round_of (const pointf_t& p) {
    return { round_of (p.x), round_of (p.y) };
}

// Fractional part, always in [0, 1).
inline double fpart_of (double x) {
    return x - std::floor (x);
}

inline double rfpart_of (double x) {
    return 1. - fpart_of (x);
}

inline double clamp01 (double x) {
    return x < 0. ? 0. : x > 1. ? 1. : x;
}

inline std::uint8_t clamp255 (int x) {
    return std::uint8_t (x < 0 ? 0 : x > 255 ? 255 : x);
}

//
// Coverage in [0, 1] to an 8-bit alpha, truncating:
//
inline std::uint8_t coverage_of (double c) {
    return clamp255 (floor_of (255. * clamp01 (c)));
}

// Compute x * y / 255, where x and y are in [0, 255].
inline std::uint8_t mul255 (std::uint8_t x, std::uint8_t y) {
    const int z = int (x) * int (y);
    return std::uint8_t ((z + (z >> 8) + 0x80) >> 8);
}

//
// Coordinates the rasterizers accept: finite, and small enough that pixel
// arithmetic on them stays within int:
//
inline bool in_range (double x) {
    return std::isfinite (x) && std::fabs (x) <= RASTERKIT_MAX_COORDINATE;
}

inline bool in_range (const pointf_t& p) {
    return in_range (p.x) && in_range (p.y);
}

inline bool in_range (const pointi_t& p) {
    return
        -RASTERKIT_MAX_COORDINATE <= p.x && p.x <= RASTERKIT_MAX_COORDINATE &&
        -RASTERKIT_MAX_COORDINATE <= p.y && p.y <= RASTERKIT_MAX_COORDINATE;
}

inline double lerp (double a, double b, double t) {
    return (1. - t) * a + t * b;
}

inline pointf_t lerp (const pointf_t& a, const pointf_t& b, double t) {
    return { lerp (a.x, b.x, t), lerp (a.y, b.y, t) };
}

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_MATH_HH
