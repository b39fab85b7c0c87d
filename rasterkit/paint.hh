// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_PAINT_HH
#define RASTERKIT_RASTERKIT_PAINT_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <rasterkit/curve.hh>
#include <rasterkit/line.hh>
#include <rasterkit/sink.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

//
// How a pixel write combines with the pixel already in the sink: `replace'
// stores the written color as is (an anti-aliased pixel keeps its coverage
// in alpha), `over' composites it source-over onto the destination.
//
enum struct blend_t { replace, over };

const char* to_string (blend_t);
std::optional< blend_t > to_blend (const std::string&);

//
// Applies the writes in order. Writes outside the sink are dropped by the
// sink; the return value counts the ones inside.
//
size_t paint (sink_t&, const std::vector< pixel_t >&, blend_t = blend_t::replace);

//
// Stamps a round brush of diameter <width> (radius width / 2) at every
// write. A pixel covered more than once keeps its first write; a width of
// one or less returns the writes as they are. Widths are capped at
// RASTERKIT_MAX_STROKE_WIDTH:
//
std::vector< pixel_t > widen (const std::vector< pixel_t >&, int width);

//
// Rasterize and paint in one go. Each clips to the sink before rasterizing
// (see bounds_of in clip.hh), so the work is bounded by the sink size
// rather than by the coordinates:
//
size_t
draw_line (sink_t&, line_algorithm_t, const pointf_t& p0, const pointf_t& p1,
           const color_t&, blend_t = blend_t::replace, int width = 1);

size_t
draw_circle (sink_t&, const pointi_t& center, int radius, const color_t&,
             blend_t = blend_t::replace, int width = 1);

size_t
draw_bezier (sink_t&, const std::vector< pointf_t >&, const color_t&,
             const curve_steps_t& = { }, blend_t = blend_t::replace,
             int width = 1);

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_PAINT_HH
