// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE shape

#include <defs.hh>

#include <cmath>
#include <limits>
#include <set>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <rasterkit/bitmap.hh>
#include <rasterkit/shape.hh>
#include <utils/error.hh>

#include "counting_sink.hh"

using namespace rasterkit;

static const color_t white{ 255, 255, 255 };
static const color_t black{   0,   0,   0 };

static std::set< pointi_t >
unique_points_of (const std::vector< pixel_t >& xs) {
    std::set< pointi_t > ps;

    for (const auto& x : xs)
        ps.insert (x.point ());

    return ps;
}

BOOST_AUTO_TEST_SUITE(shapes)

BOOST_AUTO_TEST_CASE(rectangle) {
    const auto ps = rectangle_vertices ({ 2, 3 }, { 8, 6 });

    const std::vector< pointf_t > expected{
        { 2, 3 }, { 8, 3 }, { 8, 6 }, { 2, 6 }
    };

    BOOST_TEST (ps == expected);
}

BOOST_AUTO_TEST_CASE(triangle) {
    const auto ps = triangle_vertices ({ 0, 0 }, { 10, 6 });

    const std::vector< pointf_t > expected{
        { 5, 0 }, { 0, 6 }, { 10, 6 }
    };

    BOOST_TEST (ps == expected);
}

BOOST_AUTO_TEST_CASE(star) {
    const pointf_t center{ 10, 10 };
    const auto ps = star_vertices (center, 8);

    BOOST_TEST (ps.size () == 10U);

    //
    // Tips and inner corners alternate, the first tip straight up:
    //
    BOOST_TEST (std::fabs (ps [0].x - 10) < 1e-9);
    BOOST_TEST (std::fabs (ps [0].y - 2) < 1e-9);

    for (size_t i = 0; i < ps.size (); ++i) {
        const double r = std::hypot (ps [i].x - center.x, ps [i].y - center.y);
        BOOST_TEST (std::fabs (r - (i % 2 ? 4. : 8.)) < 1e-9);
    }

    BOOST_TEST (star_vertices (center, 8, 7).size () == 14U);
}

BOOST_AUTO_TEST_CASE(star_too_few_tips) {
    std::vector< error_category_t > errors;

    auto previous = set_error_callback (
        [&](error_category_t category, const std::string&) {
            errors.push_back (category);
        });

    const auto ps = star_vertices ({ 0, 0 }, 5, 1);

    set_error_callback (previous);

    BOOST_TEST (ps.empty ());
    BOOST_TEST (errors.size () == 1U);
    BOOST_TEST (errors [0] == errGeometry);
}

BOOST_AUTO_TEST_CASE(closed_outline) {
    const auto xs = polyline (
        line_algorithm_t::bresenham,
        rectangle_vertices ({ 2, 2 }, { 8, 6 }), black, true);

    //
    // The perimeter, each corner written once:
    //
    BOOST_TEST (xs.size () == 20U);
    BOOST_TEST (unique_points_of (xs).size () == 20U);

    for (const auto& x : xs) {
        BOOST_TEST ((x.x == 2 || x.x == 8 || x.y == 2 || x.y == 6));
    }
}

BOOST_AUTO_TEST_CASE(open_outline) {
    const std::vector< pointf_t > ps{ { 0, 0 }, { 4, 0 }, { 4, 3 } };

    const auto xs = polyline (line_algorithm_t::dda, ps, black);
    const auto ys = polyline (line_algorithm_t::dda, ps, black, true);

    BOOST_TEST (xs.size () == 5U + 3U);
    BOOST_TEST (unique_points_of (xs).size () == xs.size ());

    //
    // Closing adds the edge back to the first vertex:
    //
    BOOST_TEST (ys.size () > xs.size ());
    BOOST_TEST (unique_points_of (ys).size () == ys.size ());
}

BOOST_AUTO_TEST_CASE(degenerate_outlines) {
    BOOST_TEST (polyline (line_algorithm_t::dda, { }, black).empty ());

    const auto xs = polyline (line_algorithm_t::dda, { { 3, 4 } }, black);

    BOOST_TEST (xs.size () == 1U);
    BOOST_TEST (xs [0].point () == (pointi_t{ 3, 4 }));

    //
    // Two vertices are a single edge, closed or not:
    //
    const std::vector< pointf_t > ps{ { 0, 0 }, { 5, 0 } };

    BOOST_TEST (
        polyline (line_algorithm_t::bresenham, ps, black, true).size () ==
        polyline (line_algorithm_t::bresenham, ps, black).size ());
}

BOOST_AUTO_TEST_CASE(wu_outline) {
    //
    // Anti-aliased corners overlap, each edge keeps its end caps:
    //
    const auto xs = polyline (
        line_algorithm_t::wu, { { 0, 0 }, { 4, 0 }, { 4, 4 } }, black);

    BOOST_TEST (xs.size () == 10U);
}

BOOST_AUTO_TEST_CASE(clipped_outline) {
    const auto xs = polyline (
        line_algorithm_t::bresenham,
        rectangle_vertices ({ 0, 0 }, { 10, 10 }), black, true,
        rectf_t{ 0, 0, 5, 5 });

    //
    // Only the two edges through the corner at the origin are left:
    //
    for (const auto& x : xs) {
        BOOST_TEST ((x.x == 0 || x.y == 0));
        BOOST_TEST (x.x <= 5);
        BOOST_TEST (x.y <= 5);
    }

    BOOST_TEST (unique_points_of (xs).size () == 11U);
}

BOOST_AUTO_TEST_CASE(heart_outline) {
    const auto ps = unique_points_of (
        heart (line_algorithm_t::bresenham, { 20, 20 }, 16, black));

    //
    // The tip of the triangle, and the tops of the two lobes:
    //
    BOOST_TEST (ps.count (pointi_t{ 20, 28 }));
    BOOST_TEST (ps.count (pointi_t{ 16, 14 }));
    BOOST_TEST (ps.count (pointi_t{ 24, 14 }));
    BOOST_TEST (ps.count (pointi_t{ 12, 20 }));
}

BOOST_AUTO_TEST_CASE(negative_heart) {
    std::vector< error_category_t > errors;

    auto previous = set_error_callback (
        [&](error_category_t category, const std::string&) {
            errors.push_back (category);
        });

    bitmap_t bitmap (8, 8);

    const auto xs = heart (line_algorithm_t::dda, { 4, 4 }, -2, black);
    const auto n = draw_heart (bitmap, line_algorithm_t::dda, { 4, 4 }, -2, black);

    set_error_callback (previous);

    BOOST_TEST (xs.empty ());
    BOOST_TEST (n == 0U);
    BOOST_TEST (errors.size () == 2U);
}

BOOST_AUTO_TEST_CASE(draw_shapes) {
    bitmap_t bitmap (20, 20, white);

    BOOST_TEST (
        draw_polyline (
            bitmap, line_algorithm_t::bresenham,
            rectangle_vertices ({ 2, 2 }, { 8, 6 }), black, true) == 20U);

    BOOST_TEST (bitmap.get_pixel (2, 2) == black);
    BOOST_TEST (bitmap.get_pixel (5, 4) == white);

    BOOST_TEST (
        draw_heart (bitmap, line_algorithm_t::bresenham, { 10, 12 }, 8,
                    black) > 0U);

    BOOST_TEST (bitmap.get_pixel (10, 16) == black);
}

BOOST_AUTO_TEST_CASE(huge_outline) {
    //
    // Only the bottom edge crosses the sink:
    //
    counting_sink_t sink (8, 4);

    const auto n = draw_polyline (
        sink, line_algorithm_t::bresenham,
        rectangle_vertices ({ -1e9, -1e9 }, { 1e9, 2 }), black, true);

    BOOST_TEST (n == 8U);
    BOOST_TEST (sink.bitmap.get_pixel (3, 2) == black);
}

BOOST_AUTO_TEST_CASE(clipped_draw) {
    bitmap_t bitmap (10, 10, white);

    draw_polyline (
        bitmap, line_algorithm_t::bresenham,
        rectangle_vertices ({ 1, 1 }, { 8, 8 }), black, true,
        blend_t::replace, 1, rectf_t{ 0, 0, 4, 9 });

    BOOST_TEST (bitmap.get_pixel (1, 5) == black);
    BOOST_TEST (bitmap.get_pixel (4, 1) == black);
    BOOST_TEST (bitmap.get_pixel (5, 1) == white);
    BOOST_TEST (bitmap.get_pixel (8, 5) == white);
}

BOOST_AUTO_TEST_CASE(non_finite_vertex) {
    std::vector< error_category_t > errors;

    auto previous = set_error_callback (
        [&](error_category_t category, const std::string&) {
            errors.push_back (category);
        });

    counting_sink_t sink (8, 8);

    const auto n = draw_polyline (
        sink, line_algorithm_t::dda,
        { { 0, 0 }, { std::numeric_limits< double >::quiet_NaN (), 3 } },
        black);

    set_error_callback (previous);

    BOOST_TEST (n == 0U);
    BOOST_TEST (sink.sets == 0U);
    BOOST_TEST (errors.size () == 1U);
    BOOST_TEST (errors [0] == errGeometry);
}

BOOST_AUTO_TEST_CASE(wide_outline) {
    bitmap_t bitmap (12, 12, white);

    draw_polyline (
        bitmap, line_algorithm_t::bresenham,
        rectangle_vertices ({ 3, 3 }, { 8, 8 }), black, true,
        blend_t::replace, 3);

    BOOST_TEST (bitmap.get_pixel (5, 2) == black);
    BOOST_TEST (bitmap.get_pixel (5, 4) == black);
    BOOST_TEST (bitmap.get_pixel (5, 5) == white);
}

BOOST_AUTO_TEST_SUITE_END()
