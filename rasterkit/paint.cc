// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <rasterkit/circle.hh>
#include <rasterkit/clip.hh>
#include <rasterkit/color.hh>
#include <rasterkit/curve.hh>
#include <rasterkit/line.hh>
#include <rasterkit/paint.hh>

namespace rasterkit {

const char* to_string (blend_t blend) {
    switch (blend) {
    case blend_t::replace: return "replace";
    case blend_t::over:    return "over";
    }

    return "unknown";
}

std::optional< blend_t > to_blend (const std::string& s) {
    for (auto x : { blend_t::replace, blend_t::over }) {
        if (s == to_string (x))
            return x;
    }

    return { };
}

size_t
paint (sink_t& sink, const std::vector< pixel_t >& xs, blend_t blend) {
    size_t n = 0;

    for (const auto& [ x, y, color ] : xs) {
        if (!sink.in (x, y))
            continue;

        if (blend == blend_t::over)
            sink.set_pixel (x, y, over (color, sink.get_pixel (x, y)));
        else
            sink.set_pixel (x, y, color);

        ++n;
    }

    return n;
}

std::vector< pixel_t >
widen (const std::vector< pixel_t >& xs, int width) {
    if (width <= 1)
        return xs;

    const int r = (std::min) (width, RASTERKIT_MAX_STROKE_WIDTH) / 2;

    std::vector< pointi_t > brush;

    for (int dy = -r; dy <= r; ++dy) {
        for (int dx = -r; dx <= r; ++dx) {
            if (dx * dx + dy * dy <= r * r)
                brush.push_back ({ dx, dy });
        }
    }

    std::set< pointi_t > seen;
    std::vector< pixel_t > ys;

    for (const auto& [ x, y, color ] : xs) {
        for (const auto& [ dx, dy ] : brush) {
            if (seen.insert (pointi_t{ x + dx, y + dy }).second)
                ys.push_back ({ x + dx, y + dy, color });
        }
    }

    return ys;
}

size_t
draw_line (sink_t& sink, line_algorithm_t algorithm,
           const pointf_t& p0, const pointf_t& p1,
           const color_t& color, blend_t blend, int width) {
    return draw_clipped_line (
        sink, p0, p1, bounds_of (sink, width), algorithm, color, blend, width);
}

size_t
draw_circle (sink_t& sink, const pointi_t& center, int radius,
             const color_t& color, blend_t blend, int width) {
    if (!check_circle (center, radius))
        return 0;

    const auto area = bounds_of (sink, width);

    //
    // Skip outlines that pass wholly outside the area, or around it:
    //
    if (center.x + radius < area.x_min || center.x - radius > area.x_max ||
        center.y + radius < area.y_min || center.y - radius > area.y_max)
        return 0;

    double farthest = 0.;

    for (auto x : { area.x_min, area.x_max }) {
        for (auto y : { area.y_min, area.y_max }) {
            farthest = (std::max) (
                farthest, std::hypot (x - center.x, y - center.y));
        }
    }

    if (farthest + 1. < radius)
        return 0;

    std::vector< pixel_t > xs;

    for_each_circle_point (center, radius, [&](int x, int y) {
        if (contains (area, pointi_t{ x, y }))
            xs.push_back ({ x, y, color });
    });

    return paint (sink, widen (xs, width), blend);
}

size_t
draw_bezier (sink_t& sink, const std::vector< pointf_t >& ps,
             const color_t& color, const curve_steps_t& steps, blend_t blend,
             int width) {
    const auto area = bounds_of (sink, width);

    auto xs = bezier (ps, color, steps);

    xs.erase (
        std::remove_if (xs.begin (), xs.end (), [&](const pixel_t& x) {
            return !contains (area, x.point ());
        }),
        xs.end ());

    return paint (sink, widen (xs, width), blend);
}

} // namespace rasterkit
