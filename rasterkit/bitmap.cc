// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cstdio>
#include <cstring>

#include <memory>
#include <string>
#include <vector>

#include <rasterkit/bitmap.hh>
#include <utils/error.hh>

namespace rasterkit {
namespace {

inline int extent_of (int n) { return n < 0 ? 0 : n; }

struct file_closer_t {
    void operator() (FILE* f) const { fclose (f); }
};

using file_ptr_t = std::unique_ptr< FILE, file_closer_t >;

} // anonymous

//------------------------------------------------------------------------
// bitmap_view_t
//------------------------------------------------------------------------

bitmap_view_t::bitmap_view_t (
    std::uint8_t* data, int width, int height, int row_size)
    : data_ (data), width_ (extent_of (width)), height_ (extent_of (height)),
      row_size_ (row_size) {
    ASSERT (0 == width_ * height_ || data_);
    ASSERT (row_size_ >= 4 * width_);
}

void bitmap_view_t::set_pixel (int x, int y, const color_t& c) {
    if (!in (x, y))
        return;

    auto p = at (x, y);

    p [0] = c.r;
    p [1] = c.g;
    p [2] = c.b;
    p [3] = c.a;
}

color_t bitmap_view_t::get_pixel (int x, int y) const {
    if (!in (x, y))
        return transparent;

    auto p = at (x, y);
    return color_t{ p [0], p [1], p [2], p [3] };
}

void bitmap_view_t::clear (const color_t& c) {
    if (0 == width_ || 0 == height_)
        return;

    //
    // Fill the first row, then replicate it:
    //
    auto first = at (0, 0);

    for (int x = 0; x < width_; ++x) {
        auto p = first + 4 * x;
        p [0] = c.r; p [1] = c.g; p [2] = c.b; p [3] = c.a;
    }

    for (int y = 1; y < height_; ++y) {
        memcpy (at (0, y), first, 4 * size_t (width_));
    }
}

bool bitmap_view_t::write_pnm (const std::string& filename) const {
    file_ptr_t f (fopen (filename.c_str (), "wb"));

    if (!f) {
        error (errIO, "couldn't open '{}' for writing", filename);
        return false;
    }

    return write_pnm (f.get ());
}

bool bitmap_view_t::write_pnm (FILE* f) const {
    fprintf (f, "P6\n%d %d\n255\n", width_, height_);

    std::vector< std::uint8_t > row (3 * size_t (width_));

    for (int y = 0; y < height_; ++y) {
        auto p = at (0, y);

        for (int x = 0; x < width_; ++x, p += 4) {
            row [3 * x]     = p [0];
            row [3 * x + 1] = p [1];
            row [3 * x + 2] = p [2];
        }

        if (row.size () != fwrite (row.data (), 1, row.size (), f)) {
            error (errIO, "short write in PPM row {}", y);
            return false;
        }
    }

    return 0 == fflush (f);
}

bool bitmap_view_t::write_alpha_pgm (const std::string& filename) const {
    file_ptr_t f (fopen (filename.c_str (), "wb"));

    if (!f) {
        error (errIO, "couldn't open '{}' for writing", filename);
        return false;
    }

    return write_alpha_pgm (f.get ());
}

bool bitmap_view_t::write_alpha_pgm (FILE* f) const {
    fprintf (f, "P5\n%d %d\n255\n", width_, height_);

    for (int y = 0; y < height_; ++y) {
        auto p = at (0, y);

        for (int x = 0; x < width_; ++x, p += 4) {
            if (EOF == fputc (p [3], f)) {
                error (errIO, "short write in PGM row {}", y);
                return false;
            }
        }
    }

    return 0 == fflush (f);
}

//------------------------------------------------------------------------
// bitmap_t
//------------------------------------------------------------------------

bitmap_t::bitmap_t (int width, int height, const color_t& background)
    : bitmap_storage_t (4 * size_t (extent_of (width)) * extent_of (height)),
      bitmap_view_t (member.data (), width, height) {
    if (background != transparent)
        clear (background);
}

bitmap_t::bitmap_t (const bitmap_t& other)
    : bitmap_storage_t (other.member),
      bitmap_view_t (member.data (), other.width (), other.height ())
{ }

} // namespace rasterkit
