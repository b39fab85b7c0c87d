// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <vector>

#include <rasterkit/curve.hh>
#include <rasterkit/math.hh>
#include <utils/error.hh>

#include <range/v3/action/unique.hpp>
using namespace ranges;

namespace rasterkit {
namespace {

template< typename F >
std::vector< pixel_t >
sample (int steps, bool dedup, const color_t& color, F f) {
    std::vector< pixel_t > xs;
    xs.reserve (steps + 1);

    for (int i = 0; i <= steps; ++i) {
        const auto p = round_of (f (double (i) / steps));
        xs.push_back ({ p.x, p.y, color });
    }

    if (dedup) {
        xs |= actions::unique;
    }

    return xs;
}

bool
check_control_points (const std::vector< pointf_t >& ps) {
    for (const auto& p : ps) {
        if (!in_range (p)) {
            error (errGeometry, "Bezier control point ({},{}) is out of range",
                   p.x, p.y);
            return false;
        }
    }

    return true;
}

} // anonymous

int steps_for (const std::vector< pointf_t >& ps, const curve_steps_t& policy) {
    if (policy.policy == curve_steps_t::policy_t::fixed || ps.empty ()) {
        return (std::min) ((std::max) (policy.count, 1), RASTERKIT_MAX_CURVE_STEPS);
    }

    const auto& p0 = ps.front ();
    const auto& pm = ps [(ps.size () - 1) / 2];
    const auto& pn = ps.back ();

    const double length = (std::max) (
        std::fabs (p0.x - pm.x) + std::fabs (pm.x - pn.x),
        std::fabs (p0.y - pm.y) + std::fabs (pm.y - pn.y));

    const double steps = std::ceil (length * policy.factor);

    if (!(steps < RASTERKIT_MAX_CURVE_STEPS))
        return RASTERKIT_MAX_CURVE_STEPS;

    return (std::max) (int (steps), 1);
}

pointf_t bezier_point (std::vector< pointf_t > ps, double t) {
    ASSERT (!ps.empty ());

    //
    // Each pass replaces p[i] with lerp (p[i], p[i + 1]) and drops the
    // last point, until one is left:
    //
    for (size_t n = ps.size (); n > 1; --n) {
        for (size_t i = 0; i + 1 < n; ++i) {
            ps [i] = lerp (ps [i], ps [i + 1], t);
        }
    }

    return ps.front ();
}

std::vector< pixel_t >
quadratic_bezier (
    const pointf_t& p0, const pointf_t& p1, const pointf_t& p2,
    const color_t& color, const curve_steps_t& policy) {
    if (!check_control_points ({ p0, p1, p2 }))
        return { };

    const int steps = steps_for ({ p0, p1, p2 }, policy);

    return sample (steps, policy.dedup, color, [&](double t) {
        const double mt = 1. - t;
        const double a = mt * mt, b = 2. * mt * t, c = t * t;

        return pointf_t{
            a * p0.x + b * p1.x + c * p2.x,
            a * p0.y + b * p1.y + c * p2.y
        };
    });
}

std::vector< pixel_t >
cubic_bezier (
    const pointf_t& p0, const pointf_t& p1, const pointf_t& p2,
    const pointf_t& p3, const color_t& color, const curve_steps_t& policy) {
    if (!check_control_points ({ p0, p1, p2, p3 }))
        return { };

    const int steps = steps_for ({ p0, p1, p2, p3 }, policy);

    return sample (steps, policy.dedup, color, [&](double t) {
        const double mt = 1. - t, mt2 = mt * mt, t2 = t * t;
        const double a = mt2 * mt, b = 3. * mt2 * t, c = 3. * mt * t2, d = t2 * t;

        return pointf_t{
            a * p0.x + b * p1.x + c * p2.x + d * p3.x,
            a * p0.y + b * p1.y + c * p2.y + d * p3.y
        };
    });
}

std::vector< pixel_t >
bezier (const std::vector< pointf_t >& ps, const color_t& color,
        const curve_steps_t& policy) {
    if (ps.size () < 2) {
        error (errGeometry, "a Bezier curve needs at least 2 control points, "
               "got {}", ps.size ());
        return { };
    }

    if (!check_control_points (ps))
        return { };

    const int steps = steps_for (ps, policy);

    return sample (steps, policy.dedup, color, [&](double t) {
        return bezier_point (ps, t);
    });
}

} // namespace rasterkit
