// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_BITMAP_HH
#define RASTERKIT_RASTERKIT_BITMAP_HH

#include <defs.hh>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <boost/utility/base_from_member.hpp>

#include <rasterkit/sink.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

//------------------------------------------------------------------------
// bitmap_view_t
//------------------------------------------------------------------------

//
// A sink over pixel memory owned by the caller: <height> rows of <width>
// RGBA quadruplets, consecutive rows <row_size> bytes apart. The view never
// allocates nor frees the memory; the memory must outlive the view.
//
struct bitmap_view_t : sink_t {
    bitmap_view_t (std::uint8_t* data, int width, int height)
        : bitmap_view_t (data, width, height, 4 * width)
    { }

    bitmap_view_t (std::uint8_t* data, int width, int height, int row_size);

    int width  () const override { return width_;  }
    int height () const override { return height_; }

    int row_size () const { return row_size_; }

    std::uint8_t* data () { return data_; }
    const std::uint8_t* data () const { return data_; }

    void set_pixel (int x, int y, const color_t&) override;
    color_t get_pixel (int x, int y) const override;

    // Sets every pixel to <color>.
    void clear (const color_t& color);

    //
    // Write the color data as a binary PPM (P6), or the alpha channel as a
    // binary PGM (P5). Return false on I/O failure:
    //
    bool write_pnm (const std::string& filename) const;
    bool write_pnm (FILE*) const;

    bool write_alpha_pgm (const std::string& filename) const;
    bool write_alpha_pgm (FILE*) const;

private:
    std::uint8_t* at (int x, int y) const {
        return data_ + ptrdiff_t (y) * row_size_ + 4 * x;
    }

private:
    std::uint8_t* data_;
    int width_, height_, row_size_;
};

//------------------------------------------------------------------------
// bitmap_t
//------------------------------------------------------------------------

//
// A bitmap that owns its pixel memory, for callers that have none of
// their own (tools, tests):
//
using bitmap_storage_t = boost::base_from_member< std::vector< std::uint8_t > >;

struct bitmap_t : private bitmap_storage_t, public bitmap_view_t {
    bitmap_t (int width, int height, const color_t& background = transparent);

    bitmap_t (const bitmap_t&);
    bitmap_t& operator= (const bitmap_t&) = delete;
};

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_BITMAP_HH
