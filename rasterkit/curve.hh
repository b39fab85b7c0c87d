// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_CURVE_HH
#define RASTERKIT_RASTERKIT_CURVE_HH

#include <defs.hh>

#include <vector>

#include <rasterkit/types.hh>

namespace rasterkit {

//
// How densely a curve is sampled. A fixed policy evaluates the curve at
// <count> + 1 parameter values; the adaptive policy derives the count from
// the control polygon: the larger of the per-axis distances p0 -> pm -> pn
// (pm being the middle control point), times <factor>. Either way there is
// at least one step, i.e., both ends of the curve are sampled.
//
struct curve_steps_t {
    enum struct policy_t { fixed, adaptive };

    policy_t policy = policy_t::fixed;

    int count = RASTERKIT_CURVE_STEPS;
    double factor = RASTERKIT_CURVE_STEP_FACTOR;

    //
    // Drop a sample that rounds to the same pixel as the one before it:
    //
    bool dedup = true;

    static curve_steps_t fixed (int count, bool dedup = true) {
        return { policy_t::fixed, count, RASTERKIT_CURVE_STEP_FACTOR, dedup };
    }

    static curve_steps_t adaptive (
        double factor = RASTERKIT_CURVE_STEP_FACTOR, bool dedup = true) {
        return { policy_t::adaptive, RASTERKIT_CURVE_STEPS, factor, dedup };
    }
};

// Number of steps for the control points, in [1, RASTERKIT_MAX_CURVE_STEPS].
int steps_for (const std::vector< pointf_t >&, const curve_steps_t&);

//
// Evaluates the Bezier curve with the given control points at <t> by
// repeated linear interpolation (de Casteljau), in place of recursion. The
// control points must not be empty.
//
pointf_t bezier_point (std::vector< pointf_t >, double t);

std::vector< pixel_t >
quadratic_bezier (
    const pointf_t& p0, const pointf_t& p1, const pointf_t& p2,
    const color_t&, const curve_steps_t& = { });

std::vector< pixel_t >
cubic_bezier (
    const pointf_t& p0, const pointf_t& p1, const pointf_t& p2,
    const pointf_t& p3, const color_t&, const curve_steps_t& = { });

//
// A curve of any degree; needs at least two control points, fewer is
// reported and yields nothing:
//
std::vector< pixel_t >
bezier (const std::vector< pointf_t >&, const color_t&,
        const curve_steps_t& = { });

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_CURVE_HH
