// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_LINE_HH
#define RASTERKIT_RASTERKIT_LINE_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <rasterkit/types.hh>

namespace rasterkit {

enum struct line_algorithm_t { dda, bresenham, wu };

const char* to_string (line_algorithm_t);
std::optional< line_algorithm_t > to_line_algorithm (const std::string&);

//
// Every rasterizer below logs and returns nothing for an endpoint that is
// not finite or lies beyond RASTERKIT_MAX_COORDINATE.
//

//
// Digital differential analyzer: samples the segment at max(|dx|, |dy|)
// evenly spaced points (rounded up to a whole number of steps) and rounds
// each one. Output runs from p0 to p1.
//
std::vector< pixel_t >
dda_line (const pointf_t& p0, const pointf_t& p1, const color_t&);

//
// Integer Bresenham. Produces exactly max(|dx|, |dy|) + 1 pixels, ordered
// left to right along the dominant axis (top to bottom for steep lines).
//
std::vector< pixel_t >
bresenham_line (const pointi_t& p0, const pointi_t& p1, const color_t&);

//
// Xiaolin Wu's anti-aliased line. Every output pixel carries the base color
// with its coverage in the alpha channel; up to two pixels per column (row,
// for steep lines), the end caps weighted by their horizontal gap. Pixels
// with no coverage are left out, save the main pixel of each end cap, so an
// axis-aligned line is a single pixel wide. Compositing the result is up to
// the caller.
//
std::vector< pixel_t >
wu_line (const pointf_t& p0, const pointf_t& p1, const color_t&);

//
// Dispatches to one of the above; Bresenham gets the rounded endpoints.
//
std::vector< pixel_t >
line (line_algorithm_t, const pointf_t& p0, const pointf_t& p1, const color_t&);

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_LINE_HH
