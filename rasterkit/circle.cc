// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <vector>

#include <rasterkit/circle.hh>
#include <rasterkit/math.hh>
#include <utils/error.hh>

namespace rasterkit {

bool check_circle (const pointi_t& center, int radius) {
    if (radius < 0) {
        error (errGeometry, "negative circle radius {}", radius);
        return false;
    }

    if (!in_range (center) || radius > RASTERKIT_MAX_COORDINATE ||
        !in_range (pointi_t{ center.x + radius, center.y + radius }) ||
        !in_range (pointi_t{ center.x - radius, center.y - radius })) {
        error (errGeometry, "circle at ({},{}) of radius {} is out of range",
               center.x, center.y, radius);
        return false;
    }

    return true;
}

std::vector< pixel_t >
midpoint_circle (const pointi_t& center, int radius, const color_t& color) {
    if (!check_circle (center, radius))
        return { };

    std::vector< pixel_t > xs;

    //
    // One octant is roughly r / sqrt (2) steps long:
    //
    xs.reserve (8 * (size_t (radius) * 3 / 4 + 2));

    for_each_circle_point (center, radius, [&](int x, int y) {
        xs.push_back ({ x, y, color });
    });

    return xs;
}

} // namespace rasterkit
