// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_SINK_HH
#define RASTERKIT_RASTERKIT_SINK_HH

#include <defs.hh>

#include <rasterkit/types.hh>

namespace rasterkit {

//------------------------------------------------------------------------
// sink_t
//------------------------------------------------------------------------

//
// The only surface the rasterizers write through: a width x height grid of
// colors, addressed with (0,0) at the top-left. Implementations drop writes
// outside the grid and answer reads outside it with `transparent'; neither
// throws.
//
struct sink_t {
    virtual ~sink_t () { }

    virtual int width  () const = 0;
    virtual int height () const = 0;

    virtual void set_pixel (int x, int y, const color_t&) = 0;
    virtual color_t get_pixel (int x, int y) const = 0;

    bool in (int x, int y) const {
        return 0 <= x && x < width () && 0 <= y && y < height ();
    }

    bool in (const pointi_t& p) const { return in (p.x, p.y); }
};

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_SINK_HH
