// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>

#include <optional>
#include <vector>

#include <boost/math/constants/constants.hpp>

#include <rasterkit/circle.hh>
#include <rasterkit/clip.hh>
#include <rasterkit/math.hh>
#include <rasterkit/paint.hh>
#include <rasterkit/shape.hh>
#include <utils/error.hh>

namespace rasterkit {
namespace {

//
// Joins the pixels <segment> yields for each edge. Unless <overlap>, the
// pixel of a vertex already written by the previous edge is skipped:
//
template< typename F >
std::vector< pixel_t >
trace (const std::vector< pointf_t >& ps, bool closed, bool overlap,
       F segment) {
    if (ps.empty ())
        return { };

    if (1 == ps.size ())
        return segment (ps [0], ps [0]);

    const size_t n = closed && ps.size () > 2 ? ps.size () : ps.size () - 1;

    auto vertex_of = [&](size_t i) -> std::optional< pointi_t > {
        if (overlap || !in_range (ps [i]))
            return { };

        return round_of (ps [i]);
    };

    std::vector< pixel_t > xs;

    for (size_t i = 0; i < n; ++i) {
        const size_t j = (i + 1) % ps.size ();

        const auto head = i ? vertex_of (i) : std::nullopt;
        const auto tail = closed && j == 0 ? vertex_of (0) : std::nullopt;

        for (const auto& x : segment (ps [i], ps [j])) {
            const auto p = x.point ();

            if ((head && p == *head) || (tail && p == *tail))
                continue;

            xs.push_back (x);
        }
    }

    return xs;
}

bool finite (const std::vector< pointf_t >& ps) {
    for (const auto& p : ps) {
        if (!std::isfinite (p.x) || !std::isfinite (p.y)) {
            error (errGeometry, "vertex ({},{}) is not finite", p.x, p.y);
            return false;
        }
    }

    return true;
}

} // anonymous

std::vector< pointf_t >
rectangle_vertices (const pointf_t& p0, const pointf_t& p1) {
    return { p0, { p1.x, p0.y }, p1, { p0.x, p1.y } };
}

std::vector< pointf_t >
triangle_vertices (const pointf_t& p0, const pointf_t& p1) {
    return { { (p0.x + p1.x) / 2, p0.y }, { p0.x, p1.y }, p1 };
}

std::vector< pointf_t >
star_vertices (const pointf_t& center, double radius, int points) {
    if (points < 2) {
        error (errGeometry, "a star needs at least 2 tips, got {}", points);
        return { };
    }

    using boost::math::double_constants::pi;
    using boost::math::double_constants::half_pi;

    std::vector< pointf_t > ps;
    ps.reserve (2 * size_t (points));

    for (int i = 0; i < 2 * points; ++i) {
        const double r = i % 2 ? radius / 2 : radius;
        const double a = i * pi / points - half_pi;

        ps.push_back ({ center.x + r * std::cos (a), center.y + r * std::sin (a) });
    }

    return ps;
}

std::vector< pixel_t >
polyline (line_algorithm_t algorithm, const std::vector< pointf_t >& ps,
          const color_t& color, bool closed) {
    return trace (
        ps, closed, algorithm == line_algorithm_t::wu,
        [&](const pointf_t& p, const pointf_t& q) {
            return line (algorithm, p, q, color);
        });
}

std::vector< pixel_t >
polyline (line_algorithm_t algorithm, const std::vector< pointf_t >& ps,
          const color_t& color, bool closed, const rectf_t& rect) {
    return trace (
        ps, closed, algorithm == line_algorithm_t::wu,
        [&](const pointf_t& p, const pointf_t& q) -> std::vector< pixel_t > {
            if (const auto segment = clip_line (p, q, rect)) {
                const auto& [ a, b ] = *segment;
                return line (algorithm, a, b, color);
            }

            return { };
        });
}

std::vector< pixel_t >
heart (line_algorithm_t algorithm, const pointi_t& center, int size,
       const color_t& color) {
    if (size < 0) {
        error (errGeometry, "negative heart size {}", size);
        return { };
    }

    const int half = size / 2;
    const int x = center.x, y = center.y;

    auto xs = midpoint_circle ({ x - half / 2, y - half / 3 }, half / 2, color);
    auto ys = midpoint_circle ({ x + half / 2, y - half / 3 }, half / 2, color);

    auto zs = polyline (
        algorithm,
        { { double (x - half), double (y) },
          { double (x + half), double (y) },
          { double (x), double (y + half) } },
        color, true);

    xs.insert (xs.end (), ys.begin (), ys.end ());
    xs.insert (xs.end (), zs.begin (), zs.end ());

    return xs;
}

size_t
draw_polyline (
    sink_t& sink, line_algorithm_t algorithm, const std::vector< pointf_t >& ps,
    const color_t& color, bool closed, blend_t blend, int width,
    const std::optional< rectf_t >& clip) {
    auto area = bounds_of (sink, width);

    if (clip)
        area = intersection (area, normalize (*clip));

    if (is_empty (area) || !finite (ps))
        return 0;

    return paint (
        sink, widen (polyline (algorithm, ps, color, closed, area), width),
        blend);
}

size_t
draw_heart (
    sink_t& sink, line_algorithm_t algorithm, const pointi_t& center, int size,
    const color_t& color, blend_t blend, int width,
    const std::optional< rectf_t >& clip) {
    if (size < 0) {
        error (errGeometry, "negative heart size {}", size);
        return 0;
    }

    const int half = size / 2;
    const int x = center.x, y = center.y;

    if (!in_range (center) || half > RASTERKIT_MAX_COORDINATE) {
        error (errGeometry, "heart at ({},{}) of size {} is out of range",
               x, y, size);
        return 0;
    }

    size_t n = 0;

    n += draw_circle (
        sink, { x - half / 2, y - half / 3 }, half / 2, color, blend, width);
    n += draw_circle (
        sink, { x + half / 2, y - half / 3 }, half / 2, color, blend, width);

    n += draw_polyline (
        sink, algorithm,
        { { double (x - half), double (y) },
          { double (x + half), double (y) },
          { double (x), double (y + half) } },
        color, true, blend, width, clip);

    return n;
}

} // namespace rasterkit
