// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE bitmap

#include <defs.hh>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <rasterkit/bitmap.hh>
#include <rasterkit/paint.hh>

using namespace rasterkit;

static const color_t red{ 255, 0, 0 };

struct file_closer_t {
    void operator() (FILE* f) const { fclose (f); }
};

static std::string
contents_of (FILE* f) {
    std::string s;

    rewind (f);

    for (int c; EOF != (c = fgetc (f));)
        s.push_back (char (c));

    return s;
}

BOOST_AUTO_TEST_SUITE(bitmaps)

BOOST_AUTO_TEST_CASE(transparent_by_default) {
    bitmap_t bitmap (3, 2);

    BOOST_TEST (bitmap.width () == 3);
    BOOST_TEST (bitmap.height () == 2);

    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) {
            BOOST_TEST (bitmap.get_pixel (x, y) == transparent);
        }
    }
}

BOOST_AUTO_TEST_CASE(background) {
    bitmap_t bitmap (4, 4, red);

    BOOST_TEST (bitmap.get_pixel (0, 0) == red);
    BOOST_TEST (bitmap.get_pixel (3, 3) == red);
}

BOOST_AUTO_TEST_CASE(set_and_get) {
    bitmap_t bitmap (4, 3);

    const color_t c{ 1, 2, 3, 4 };
    bitmap.set_pixel (2, 1, c);

    BOOST_TEST (bitmap.get_pixel (2, 1) == c);
    BOOST_TEST (bitmap.get_pixel (1, 2) == transparent);

    //
    // Row-major, four bytes per pixel:
    //
    const auto p = bitmap.data () + 1 * bitmap.row_size () + 2 * 4;

    BOOST_TEST (int (p [0]) == 1);
    BOOST_TEST (int (p [3]) == 4);
}

BOOST_AUTO_TEST_CASE(outside_bounds) {
    bitmap_t bitmap (4, 3, red);

    for (auto [ x, y ] : std::vector< pointi_t >{
            { -1, 0 }, { 0, -1 }, { 4, 0 }, { 0, 3 }, { 100, 100 } }) {
        bitmap.set_pixel (x, y, color_t{ 0, 0, 0 });
        BOOST_TEST (bitmap.get_pixel (x, y) == transparent);
        BOOST_TEST (!bitmap.in (x, y));
    }

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 4; ++x) {
            BOOST_TEST (bitmap.get_pixel (x, y) == red);
        }
    }
}

BOOST_AUTO_TEST_CASE(borrowed_memory) {
    //
    // Two 2x2 rows with 4 bytes of padding each:
    //
    std::vector< std::uint8_t > memory (2 * 12, 0xAA);

    bitmap_view_t view (memory.data (), 2, 2, 12);
    view.clear (transparent);

    view.set_pixel (1, 1, red);

    BOOST_TEST (int (memory [12 + 4]) == 255);
    BOOST_TEST (int (memory [12 + 7]) == 255);

    //
    // Padding is never touched:
    //
    for (size_t i : { 8, 9, 10, 11, 20, 21, 22, 23 }) {
        BOOST_TEST (int (memory [i]) == 0xAA);
    }

    BOOST_TEST (paint (view, { { 0, 0, red }, { 5, 5, red } }) == 1U);
    BOOST_TEST (view.get_pixel (0, 0) == red);
}

BOOST_AUTO_TEST_CASE(copies_are_independent) {
    bitmap_t lhs (2, 2, red);
    bitmap_t rhs (lhs);

    rhs.set_pixel (0, 0, transparent);

    BOOST_TEST (lhs.get_pixel (0, 0) == red);
    BOOST_TEST (rhs.get_pixel (0, 0) == transparent);
    BOOST_TEST (rhs.get_pixel (1, 1) == red);
}

BOOST_AUTO_TEST_CASE(empty) {
    bitmap_t bitmap (0, 0);

    BOOST_TEST (!bitmap.in (0, 0));

    bitmap.clear (red);
    bitmap.set_pixel (0, 0, red);

    BOOST_TEST (bitmap.get_pixel (0, 0) == transparent);
}

BOOST_AUTO_TEST_CASE(pnm) {
    bitmap_t bitmap (2, 1, color_t{ 1, 2, 3, 4 });
    bitmap.set_pixel (1, 0, color_t{ 5, 6, 7, 8 });

    std::unique_ptr< FILE, file_closer_t > f (tmpfile ());
    BOOST_TEST_REQUIRE (bool (f));

    BOOST_TEST (bitmap.write_pnm (f.get ()));
    BOOST_TEST (contents_of (f.get ()) == std::string ("P6\n2 1\n255\n\1\2\3\5\6\7"));
}

BOOST_AUTO_TEST_CASE(alpha_pgm) {
    bitmap_t bitmap (2, 1, color_t{ 1, 2, 3, 4 });
    bitmap.set_pixel (1, 0, color_t{ 5, 6, 7, 8 });

    std::unique_ptr< FILE, file_closer_t > f (tmpfile ());
    BOOST_TEST_REQUIRE (bool (f));

    BOOST_TEST (bitmap.write_alpha_pgm (f.get ()));
    BOOST_TEST (contents_of (f.get ()) == std::string ("P5\n2 1\n255\n\4\10"));
}

BOOST_AUTO_TEST_CASE(unwritable) {
    bitmap_t bitmap (1, 1);

    BOOST_TEST (!bitmap.write_pnm ("/nonexistent/directory/out.ppm"));
}

BOOST_AUTO_TEST_SUITE_END()
