// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_FILL_HH
#define RASTERKIT_RASTERKIT_FILL_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <rasterkit/sink.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

enum struct fill_algorithm_t { stack, span };

const char* to_string (fill_algorithm_t);
std::optional< fill_algorithm_t > to_fill_algorithm (const std::string&);

//
// 4-connected flood fill. Repaints with <color> every pixel reachable from
// <seed> through N/S/E/W neighbors whose color matches the seed's initial
// color within <tolerance> (per channel, absolute difference). Returns the
// repainted pixels in the order they were painted.
//
// Nothing is painted if the seed color already matches <color>, or if the
// seed lies outside the sink (the latter is reported).
//
// The worklist is an explicit stack, one entry per neighbor:
//
std::vector< pointi_t >
flood_fill (sink_t&, const pointi_t& seed, const color_t&, int tolerance = 0);

//
// Same pixel set as flood_fill, but the worklist holds one entry per
// horizontal run of matching pixels:
//
std::vector< pointi_t >
flood_fill_span (
    sink_t&, const pointi_t& seed, const color_t&, int tolerance = 0);

std::vector< pointi_t >
fill (fill_algorithm_t, sink_t&, const pointi_t& seed, const color_t&,
      int tolerance = 0);

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_FILL_HH
