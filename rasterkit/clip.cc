// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <optional>
#include <tuple>

#include <rasterkit/clip.hh>
#include <rasterkit/paint.hh>
#include <utils/error.hh>

namespace rasterkit {

unsigned outcode (const pointf_t& p, const rectf_t& r) {
    unsigned code = clipInside;

    if (p.x < r.x_min)
        code |= clipLeft;
    else if (p.x > r.x_max)
        code |= clipRight;

    if (p.y < r.y_min)
        code |= clipBottom;
    else if (p.y > r.y_max)
        code |= clipTop;

    return code;
}

std::optional< segment_t >
clip_line (const pointf_t& p0, const pointf_t& p1, const rectf_t& rect) {
    auto a = p0, b = p1;
    auto code0 = outcode (a, rect), code1 = outcode (b, rect);

    for (;;) {
        if (0 == (code0 | code1))
            return segment_t{ a, b };

        if (code0 & code1)
            return { };

        //
        // At least one endpoint is outside; move it onto the boundary it
        // is outside of. A set bit implies the segment crosses that
        // boundary's line, hence the divisor is never zero:
        //
        const auto code = code0 ? code0 : code1;

        pointf_t p;

        if (code & clipTop) {
            p = { a.x + (b.x - a.x) * (rect.y_max - a.y) / (b.y - a.y), rect.y_max };
        }
        else if (code & clipBottom) {
            p = { a.x + (b.x - a.x) * (rect.y_min - a.y) / (b.y - a.y), rect.y_min };
        }
        else if (code & clipRight) {
            p = { rect.x_max, a.y + (b.y - a.y) * (rect.x_max - a.x) / (b.x - a.x) };
        }
        else {
            ASSERT (code & clipLeft);
            p = { rect.x_min, a.y + (b.y - a.y) * (rect.x_min - a.x) / (b.x - a.x) };
        }

        if (code == code0) {
            a = p;
            code0 = outcode (a, rect);
        }
        else {
            b = p;
            code1 = outcode (b, rect);
        }
    }
}

rectf_t bounds_of (const sink_t& sink, int width) {
    const double margin = 1. + (std::max) (width, 1) / 2;

    return rectf_t{
        -margin, -margin, sink.width () + margin - 1., sink.height () + margin - 1.
    };
}

size_t
draw_clipped_line (
    sink_t& sink, const pointf_t& p0, const pointf_t& p1, const rectf_t& rect,
    line_algorithm_t algorithm, const color_t& color, blend_t blend,
    int width) {
    const auto area = intersection (normalize (rect), bounds_of (sink, width));

    if (is_empty (area))
        return 0;

    if (!std::isfinite (p0.x) || !std::isfinite (p0.y) ||
        !std::isfinite (p1.x) || !std::isfinite (p1.y)) {
        error (errGeometry, "line endpoints ({},{}) and ({},{}) are not finite",
               p0.x, p0.y, p1.x, p1.y);
        return 0;
    }

    const auto segment = clip_line (p0, p1, area);

    if (!segment)
        return 0;

    const auto& [ a, b ] = *segment;

    return paint (sink, widen (line (algorithm, a, b, color), width), blend);
}

} // namespace rasterkit
