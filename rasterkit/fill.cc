// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <rasterkit/color.hh>
#include <rasterkit/fill.hh>
#include <utils/error.hh>

namespace rasterkit {
namespace {

//
// Per-call fill state: the seed color, and which pixels were already
// painted. The visited set, rather than the painted color, stops the
// traversal, since with a tolerance the new color may itself match the
// seed color.
//
struct region_t {
    region_t (sink_t& sink, const color_t& target, int tolerance)
        : sink (sink), target (target), tolerance (tolerance),
          width (sink.width ()), height (sink.height ()),
          visited (size_t (width) * height, false)
    { }

    bool fillable (int x, int y) const {
        return sink.in (x, y)
            && !visited [size_t (y) * width + x]
            && matches (sink.get_pixel (x, y), target, tolerance);
    }

    void paint (int x, int y, const color_t& color) {
        visited [size_t (y) * width + x] = true;
        sink.set_pixel (x, y, color);
        painted.push_back ({ x, y });
    }

    sink_t& sink;

    color_t target;
    int tolerance;

    int width, height;

    std::vector< bool > visited;
    std::vector< pointi_t > painted;
};

//
// Returns the seed color, or nothing if there is nothing to paint:
//
std::optional< color_t >
target_of (sink_t& sink, const pointi_t& seed, const color_t& color,
           int tolerance) {
    if (!sink.in (seed)) {
        error (errGeometry, "fill seed ({},{}) is outside the {}x{} bitmap",
               seed.x, seed.y, sink.width (), sink.height ());
        return { };
    }

    const auto target = sink.get_pixel (seed.x, seed.y);

    if (matches (target, color, tolerance))
        return { };

    return target;
}

} // anonymous

const char* to_string (fill_algorithm_t algorithm) {
    switch (algorithm) {
    case fill_algorithm_t::stack: return "stack";
    case fill_algorithm_t::span:  return "span";
    }

    return "unknown";
}

std::optional< fill_algorithm_t > to_fill_algorithm (const std::string& s) {
    for (auto x : { fill_algorithm_t::stack, fill_algorithm_t::span }) {
        if (s == to_string (x))
            return x;
    }

    return { };
}

////////////////////////////////////////////////////////////////////////

std::vector< pointi_t >
flood_fill (sink_t& sink, const pointi_t& seed, const color_t& color,
            int tolerance) {
    const auto target = target_of (sink, seed, color, tolerance);

    if (!target)
        return { };

    region_t region (sink, *target, tolerance);

    std::vector< pointi_t > stack{ seed };

    while (!stack.empty ()) {
        const auto [ x, y ] = stack.back ();
        stack.pop_back ();

        if (!region.fillable (x, y))
            continue;

        region.paint (x, y, color);

        stack.push_back ({ x + 1, y });
        stack.push_back ({ x - 1, y });
        stack.push_back ({ x, y + 1 });
        stack.push_back ({ x, y - 1 });
    }

    return std::move (region.painted);
}

std::vector< pointi_t >
flood_fill_span (sink_t& sink, const pointi_t& seed, const color_t& color,
                 int tolerance) {
    const auto target = target_of (sink, seed, color, tolerance);

    if (!target)
        return { };

    region_t region (sink, *target, tolerance);

    std::vector< pointi_t > stack{ seed };

    //
    // Pushes the left end of every fillable run in row <y> within
    // [x0, x1]:
    //
    auto scan = [&](int x0, int x1, int y) {
        for (int x = x0; x <= x1;) {
            if (!region.fillable (x, y)) {
                ++x;
                continue;
            }

            stack.push_back ({ x, y });

            for (++x; x <= x1 && region.fillable (x, y); ++x) ;
        }
    };

    while (!stack.empty ()) {
        const auto p = stack.back ();
        stack.pop_back ();

        if (!region.fillable (p.x, p.y))
            continue;

        int x0 = p.x, x1 = p.x;

        for (; region.fillable (x0 - 1, p.y); --x0) ;
        for (; region.fillable (x1 + 1, p.y); ++x1) ;

        for (int x = x0; x <= x1; ++x) {
            region.paint (x, p.y, color);
        }

        scan (x0, x1, p.y - 1);
        scan (x0, x1, p.y + 1);
    }

    return std::move (region.painted);
}

std::vector< pointi_t >
fill (fill_algorithm_t algorithm, sink_t& sink, const pointi_t& seed,
      const color_t& color, int tolerance) {
    switch (algorithm) {
    case fill_algorithm_t::stack:
        return flood_fill (sink, seed, color, tolerance);

    case fill_algorithm_t::span:
        return flood_fill_span (sink, seed, color, tolerance);
    }

    return { };
}

} // namespace rasterkit
