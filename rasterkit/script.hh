// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_SCRIPT_HH
#define RASTERKIT_RASTERKIT_SCRIPT_HH

#include <defs.hh>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <rasterkit/params.hh>
#include <rasterkit/sink.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

//------------------------------------------------------------------------
// script_t
//------------------------------------------------------------------------

//
// Drives the rasterizers from a line-oriented drawing script:
//
//   color     #RRGGBB[AA]
//   line      x0 y0 x1 y1                (the configured line algorithm)
//   dda       x0 y0 x1 y1
//   bresenham x0 y0 x1 y1
//   wu        x0 y0 x1 y1
//   circle    cx cy r
//   quad      x0 y0 x1 y1 x2 y2
//   cubic     x0 y0 x1 y1 x2 y2 x3 y3
//   bezier    x0 y0 x1 y1 [xi yi]...
//   rect      x0 y0 x1 y1                (opposite corners)
//   triangle  x0 y0 x1 y1                (bounding box, apex at y0)
//   polyline  x0 y0 x1 y1 [xi yi]...
//   polygon   x0 y0 x1 y1 x2 y2 [xi yi]...
//   star      cx cy r [tips]
//   heart     cx cy size
//   fill      x y [tolerance]
//   width     n                          (stroke width of what follows)
//   clip      xmin ymin xmax ymax        (applies to lines and polygons)
//   noclip
//
// Outlines are drawn with the configured line algorithm. Blank lines and
// `#' comments are ignored. A malformed command throws std::runtime_error
// naming the script and line.
//
class script_t {
public:
    script_t (sink_t&, const params_t&);

    void run (std::istream&, const std::string& name = "<script>");

    void execute (
        const std::string& line, const std::string& name = "<script>",
        int lineno = 1);

    const color_t& get_color () const { return color; }
    const std::optional< rectf_t >& get_clip () const { return clip; }

    int get_width () const { return width; }

    // Number of pixel writes so far that landed inside the sink.
    size_t get_writes () const { return writes; }

private:
    using tokens_type = std::vector< std::string >;

    void draw_line (line_algorithm_t, const tokens_type&);
    void draw_polyline (const std::vector< pointf_t >&, bool closed);

    // Paints pixels that may reach off the sink, with the stroke width.
    void stroke (const std::vector< pixel_t >&);

private:
    sink_t& sink;
    const params_t& params;

    color_t color;
    std::optional< rectf_t > clip;

    int width;

    size_t writes;
};

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_SCRIPT_HH
