// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>
#include <cstdlib>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <rasterkit/color.hh>
#include <rasterkit/line.hh>
#include <rasterkit/math.hh>
#include <utils/error.hh>

namespace rasterkit {
namespace {

template< typename T >
bool
check_endpoints (const char* name, const T& p0, const T& p1) {
    if (in_range (p0) && in_range (p1))
        return true;

    error (errGeometry, "{} line endpoints ({},{}) and ({},{}) are out of range",
           name, p0.x, p0.y, p1.x, p1.y);

    return false;
}

} // anonymous

const char* to_string (line_algorithm_t algorithm) {
    switch (algorithm) {
    case line_algorithm_t::dda:       return "dda";
    case line_algorithm_t::bresenham: return "bresenham";
    case line_algorithm_t::wu:        return "wu";
    }

    return "unknown";
}

std::optional< line_algorithm_t > to_line_algorithm (const std::string& s) {
    for (auto x : {
            line_algorithm_t::dda,
            line_algorithm_t::bresenham,
            line_algorithm_t::wu }) {
        if (s == to_string (x))
            return x;
    }

    return { };
}

////////////////////////////////////////////////////////////////////////

std::vector< pixel_t >
dda_line (const pointf_t& p0, const pointf_t& p1, const color_t& color) {
    if (!check_endpoints ("DDA", p0, p1))
        return { };

    const double dx = p1.x - p0.x, dy = p1.y - p0.y;
    const int steps = ceil_of ((std::max) (std::fabs (dx), std::fabs (dy)));

    if (0 == steps) {
        return { pixel_t{ round_of (p0.x), round_of (p0.y), color } };
    }

    std::vector< pixel_t > xs;
    xs.reserve (steps + 1);

    const double xinc = dx / steps, yinc = dy / steps;

    double x = p0.x, y = p0.y;

    for (int i = 0; i < steps; ++i, x += xinc, y += yinc) {
        xs.push_back ({ round_of (x), round_of (y), color });
    }

    //
    // The last sample is the endpoint itself, not the accumulated sum:
    //
    xs.push_back ({ round_of (p1.x), round_of (p1.y), color });

    return xs;
}

////////////////////////////////////////////////////////////////////////

std::vector< pixel_t >
bresenham_line (const pointi_t& p0, const pointi_t& p1, const color_t& color) {
    if (!check_endpoints ("Bresenham", p0, p1))
        return { };

    auto [ x0, y0 ] = p0;
    auto [ x1, y1 ] = p1;

    const bool steep = std::abs (y1 - y0) > std::abs (x1 - x0);

    if (steep) {
        std::swap (x0, y0);
        std::swap (x1, y1);
    }

    if (x0 > x1) {
        std::swap (x0, x1);
        std::swap (y0, y1);
    }

    const int dx = x1 - x0, dy = std::abs (y1 - y0);
    const int ystep = y0 < y1 ? 1 : -1;

    int error = dx / 2;

    std::vector< pixel_t > xs;
    xs.reserve (dx + 1);

    for (int x = x0, y = y0; x <= x1; ++x) {
        if (steep)
            xs.push_back ({ y, x, color });
        else
            xs.push_back ({ x, y, color });

        if ((error -= dy) < 0) {
            y += ystep;
            error += dx;
        }
    }

    return xs;
}

////////////////////////////////////////////////////////////////////////

std::vector< pixel_t >
wu_line (const pointf_t& p0, const pointf_t& p1, const color_t& color) {
    if (!check_endpoints ("Wu", p0, p1))
        return { };

    if (p0 == p1) {
        return { pixel_t{ round_of (p0.x), round_of (p0.y), color } };
    }

    auto [ x0, y0 ] = p0;
    auto [ x1, y1 ] = p1;

    const bool steep = std::fabs (y1 - y0) > std::fabs (x1 - x0);

    if (steep) {
        std::swap (x0, y0);
        std::swap (x1, y1);
    }

    if (x0 > x1) {
        std::swap (x0, x1);
        std::swap (y0, y1);
    }

    const double dx = x1 - x0, dy = y1 - y0;
    const double gradient = 0 == dx ? 1. : dy / dx;

    std::vector< pixel_t > xs;
    xs.reserve (2 * (size_t (std::ceil (dx)) + 2));

    //
    // A pixel without coverage is dropped unless <keep>:
    //
    auto plot = [&](int x, int y, double coverage, bool keep = false) {
        const auto alpha = coverage_of (coverage);

        if (0 == alpha && !keep)
            return;

        auto c = with_alpha (color, mul255 (color.a, alpha));

        if (steep)
            xs.push_back ({ y, x, c });
        else
            xs.push_back ({ x, y, c });
    };

    //
    // First end cap:
    //
    int xend = round_of (x0);
    double yend = y0 + gradient * (xend - x0);
    double xgap = rfpart_of (x0 + 0.5);

    const int xpxl1 = xend, ypxl1 = floor_of (yend);

    plot (xpxl1, ypxl1,     rfpart_of (yend) * xgap, true);
    plot (xpxl1, ypxl1 + 1,  fpart_of (yend) * xgap);

    double intery = yend + gradient;

    //
    // Second end cap:
    //
    xend = round_of (x1);
    yend = y1 + gradient * (xend - x1);
    xgap = fpart_of (x1 + 0.5);

    const int xpxl2 = xend, ypxl2 = floor_of (yend);

    plot (xpxl2, ypxl2,     rfpart_of (yend) * xgap, true);
    plot (xpxl2, ypxl2 + 1,  fpart_of (yend) * xgap);

    //
    // Interior spans, two pixels straddling the ideal line:
    //
    for (int x = xpxl1 + 1; x < xpxl2; ++x, intery += gradient) {
        const int y = floor_of (intery);

        plot (x, y,     rfpart_of (intery));
        plot (x, y + 1,  fpart_of (intery));
    }

    return xs;
}

////////////////////////////////////////////////////////////////////////

std::vector< pixel_t >
line (line_algorithm_t algorithm,
      const pointf_t& p0, const pointf_t& p1, const color_t& color) {
    switch (algorithm) {
    case line_algorithm_t::dda:
        return dda_line (p0, p1, color);

    case line_algorithm_t::bresenham:
        if (!check_endpoints ("Bresenham", p0, p1))
            return { };

        return bresenham_line (round_of (p0), round_of (p1), color);

    case line_algorithm_t::wu:
        return wu_line (p0, p1, color);
    }

    return { };
}

} // namespace rasterkit
