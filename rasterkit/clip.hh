// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_CLIP_HH
#define RASTERKIT_RASTERKIT_CLIP_HH

#include <defs.hh>

#include <optional>
#include <tuple>

#include <rasterkit/line.hh>
#include <rasterkit/paint.hh>
#include <rasterkit/sink.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

//
// Cohen-Sutherland region codes. TOP is the side of larger y:
//
enum outcode_t : unsigned {
    clipInside = 0,
    clipLeft   = 1,
    clipRight  = 2,
    clipBottom = 4,
    clipTop    = 8
};

unsigned outcode (const pointf_t&, const rectf_t&);

using segment_t = std::tuple< pointf_t, pointf_t >;

//
// Clips the segment p0-p1 against <rect> (bounds inclusive). Returns the
// visible part, or nothing when the segment misses the rectangle. A segment
// entirely inside is returned unchanged; a clipped endpoint lies exactly on
// the boundary it was clipped against.
//
std::optional< segment_t >
clip_line (const pointf_t& p0, const pointf_t& p1, const rectf_t& rect);

//
// The area a brush of <width> must stay within to reach the sink: the sink
// grown by one pixel plus the brush radius on every side. Drawing clips to
// it first, so the work done tracks the sink and not the input:
//
rectf_t bounds_of (const sink_t&, int width = 1);

//
// Clips to <rect> and to the sink, then paints the visible part with
// <algorithm> and a brush of <width>. A rejected segment does not touch the
// sink at all. Returns the number of pixels painted:
//
size_t
draw_clipped_line (
    sink_t&, const pointf_t& p0, const pointf_t& p1, const rectf_t& rect,
    line_algorithm_t, const color_t&, blend_t = blend_t::replace,
    int width = 1);

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_CLIP_HH
