// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_CIRCLE_HH
#define RASTERKIT_RASTERKIT_CIRCLE_HH

#include <defs.hh>

#include <vector>

#include <rasterkit/types.hh>

namespace rasterkit {

//
// False, after reporting it, for a negative radius or for a circle that
// reaches beyond RASTERKIT_MAX_COORDINATE:
//
bool check_circle (const pointi_t& center, int radius);

//
// Calls f (x, y) for every point of the outline, in the order
// midpoint_circle emits them, without storing any. The circle must pass
// check_circle:
//
template< typename F >
void for_each_circle_point (const pointi_t& center, int radius, F f) {
    const int cx = center.x, cy = center.y;

    if (0 == radius) {
        f (cx, cy);
        return;
    }

    auto octet = [&](int x, int y) {
        f (cx + x, cy + y);
        f (cx - x, cy + y);
        f (cx + x, cy - y);
        f (cx - x, cy - y);
        f (cx + y, cy + x);
        f (cx - y, cy + x);
        f (cx + y, cy - x);
        f (cx - y, cy - x);
    };

    int x = 0, y = radius, d = 1 - radius;

    octet (x, y);

    while (x < y) {
        ++x;

        if (d < 0) {
            d += 2 * x + 1;
        }
        else {
            --y;
            d += 2 * (x - y) + 1;
        }

        octet (x, y);
    }
}

//
// Midpoint (Bresenham) circle outline, integer arithmetic only. Each
// generated octant point is emitted with its seven reflections, in a fixed
// order; points where the reflections coincide (on the axes, on the
// diagonals) appear more than once. A zero radius yields the center alone;
// a negative radius is reported and yields nothing.
//
std::vector< pixel_t >
midpoint_circle (const pointi_t& center, int radius, const color_t&);

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_CIRCLE_HH
