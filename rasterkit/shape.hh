// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_SHAPE_HH
#define RASTERKIT_RASTERKIT_SHAPE_HH

#include <defs.hh>

#include <optional>
#include <vector>

#include <rasterkit/line.hh>
#include <rasterkit/paint.hh>
#include <rasterkit/sink.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

//
// Outline vertices of the stock shapes, in drawing order:
//

// The axis-aligned rectangle with opposite corners p0 and p1.
std::vector< pointf_t >
rectangle_vertices (const pointf_t& p0, const pointf_t& p1);

//
// The triangle inscribed in the box p0-p1: its apex in the middle of the
// edge at p0.y, its base along the edge at p1.y:
//
std::vector< pointf_t >
triangle_vertices (const pointf_t& p0, const pointf_t& p1);

//
// A star of <points> tips: 2 * points vertices alternating between
// <radius> and radius / 2, the first tip straight above (at smaller y) the
// center. Fewer than two tips is reported and yields nothing:
//
std::vector< pointf_t >
star_vertices (const pointf_t& center, double radius, int points = 5);

//
// The segments between consecutive vertices, and back to the first one if
// <closed>, rasterized with <algorithm>. A lone vertex is a zero-length
// line. With DDA and Bresenham a pixel at a shared vertex is written once;
// Wu end caps at a vertex overlap.
//
std::vector< pixel_t >
polyline (line_algorithm_t, const std::vector< pointf_t >&, const color_t&,
          bool closed = false);

//
// The same, each segment clipped to <rect> before it is rasterized:
//
std::vector< pixel_t >
polyline (line_algorithm_t, const std::vector< pointf_t >&, const color_t&,
          bool closed, const rectf_t& rect);

//
// A heart of <size> around <center>: two circles of radius size / 4 side by
// side above the center, over a triangle pointing to larger y:
//
std::vector< pixel_t >
heart (line_algorithm_t, const pointi_t& center, int size, const color_t&);

//
// Rasterize and paint, clipped to the sink and to <clip>, if any, with a
// brush of <width>. Return the number of pixels painted:
//
size_t
draw_polyline (
    sink_t&, line_algorithm_t, const std::vector< pointf_t >&, const color_t&,
    bool closed = false, blend_t = blend_t::replace, int width = 1,
    const std::optional< rectf_t >& clip = { });

size_t
draw_heart (
    sink_t&, line_algorithm_t, const pointi_t& center, int size,
    const color_t&, blend_t = blend_t::replace, int width = 1,
    const std::optional< rectf_t >& clip = { });

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_SHAPE_HH
