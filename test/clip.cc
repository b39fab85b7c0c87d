// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE clip

#include <defs.hh>

#include <cmath>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <rasterkit/clip.hh>

#include "counting_sink.hh"

using namespace rasterkit;

static const rectf_t unit_rect{ 0, 0, 10, 10 };

static const color_t black{ 0, 0, 0 };

static bool
near (const pointf_t& lhs, const pointf_t& rhs, double eps = 1e-9) {
    return std::fabs (lhs.x - rhs.x) < eps && std::fabs (lhs.y - rhs.y) < eps;
}

BOOST_AUTO_TEST_SUITE(clipping)

static const std::vector< std::tuple< pointf_t, unsigned > >
outcode_dataset = {
    { {   5,   5 }, clipInside },
    { {   0,   0 }, clipInside },
    { {  10,  10 }, clipInside },
    { {  -1,   5 }, clipLeft },
    { {  11,   5 }, clipRight },
    { {   5,  -1 }, clipBottom },
    { {   5,  11 }, clipTop },
    { {  -1,  -1 }, clipLeft  | clipBottom },
    { {  11,  11 }, clipRight | clipTop },
    { {  -1,  11 }, clipLeft  | clipTop },
    { {  11,  -1 }, clipRight | clipBottom },
};

BOOST_DATA_TEST_CASE(outcode_, data::make (outcode_dataset), p, code) {
    BOOST_TEST (outcode (p, unit_rect) == code);
}

static const std::vector< std::tuple< pointf_t, pointf_t, pointf_t, pointf_t > >
accept_dataset = {
    // inside, unchanged
    { {  2,  3 }, {  7,  8 }, {  2,  3 }, {  7,  8 } },
    // horizontal through both sides
    { { -5,  5 }, { 15,  5 }, {  0,  5 }, { 10,  5 } },
    { { 15,  5 }, { -5,  5 }, { 10,  5 }, {  0,  5 } },
    // vertical through top and bottom
    { {  5, -5 }, {  5, 15 }, {  5,  0 }, {  5, 10 } },
    // diagonal through two corners
    { { -5, -5 }, { 15, 15 }, {  0,  0 }, { 10, 10 } },
    // one endpoint inside
    { {  5,  5 }, { 20,  5 }, {  5,  5 }, { 10,  5 } },
    { {  5,  5 }, {  5, -3 }, {  5,  5 }, {  5,  0 } },
    // on the boundary
    { {  0,  0 }, { 10,  0 }, {  0,  0 }, { 10,  0 } },
};

BOOST_DATA_TEST_CASE(
    accept, data::make (accept_dataset), p0, p1, q0, q1) {
    const auto segment = clip_line (p0, p1, unit_rect);

    BOOST_TEST (bool (segment));

    if (segment) {
        const auto& [ a, b ] = *segment;

        BOOST_TEST (near (a, q0));
        BOOST_TEST (near (b, q1));
    }
}

static const std::vector< std::tuple< pointf_t, pointf_t > >
reject_dataset = {
    // entirely on one side
    { { -5,  1 }, { -1,  9 } },
    { { 11,  1 }, { 20,  9 } },
    { {  1, -5 }, {  9, -1 } },
    { {  1, 11 }, {  9, 20 } },
    // crosses two outside regions, misses the corner
    { { -5,  8 }, {  3, 15 } },
    { {  8, -5 }, { 15,  3 } },
};

BOOST_DATA_TEST_CASE(reject, data::make (reject_dataset), p0, p1) {
    BOOST_TEST (!clip_line (p0, p1, unit_rect));
}

BOOST_DATA_TEST_CASE(
    inside_rect, data::make (accept_dataset), p0, p1, q0, q1) {
    if (auto segment = clip_line (p0, p1, unit_rect)) {
        const auto& [ a, b ] = *segment;

        BOOST_TEST (outcode (a, unit_rect) == unsigned (clipInside));
        BOOST_TEST (outcode (b, unit_rect) == unsigned (clipInside));
    }
}

BOOST_AUTO_TEST_CASE(scenario) {
    const auto segment = clip_line ({ -5, 5 }, { 15, 5 }, unit_rect);

    BOOST_TEST (bool (segment));
    BOOST_TEST (std::get< 0 > (*segment) == (pointf_t{ 0, 5 }));
    BOOST_TEST (std::get< 1 > (*segment) == (pointf_t{ 10, 5 }));
}

BOOST_AUTO_TEST_CASE(degenerate_segments) {
    //
    // A point inside is accepted as is, a point outside is rejected:
    //
    BOOST_TEST (bool (clip_line ({ 3, 3 }, { 3, 3 }, unit_rect)));
    BOOST_TEST (!clip_line ({ -3, 3 }, { -3, 3 }, unit_rect));
}

BOOST_AUTO_TEST_CASE(rejection_is_silent) {
    counting_sink_t sink (20, 20);

    for (auto algorithm : {
            line_algorithm_t::dda,
            line_algorithm_t::bresenham,
            line_algorithm_t::wu }) {
        BOOST_TEST (
            0U == draw_clipped_line (
                sink, { -5, 8 }, { 3, 15 }, unit_rect, algorithm, black));
    }

    BOOST_TEST (sink.sets == 0U);
    BOOST_TEST (sink.gets == 0U);
}

BOOST_AUTO_TEST_CASE(draws_clipped_part) {
    counting_sink_t sink (20, 20);

    const auto n = draw_clipped_line (
        sink, { -5, 5 }, { 15, 5 }, unit_rect, line_algorithm_t::bresenham,
        black);

    BOOST_TEST (n == 11U);
    BOOST_TEST (sink.sets == 11U);

    for (int x = 0; x < 20; ++x) {
        BOOST_TEST (
            (sink.bitmap.get_pixel (x, 5) == black) == (x <= 10));
    }
}

BOOST_AUTO_TEST_CASE(unnormalized_rect) {
    counting_sink_t sink (20, 20);

    const auto n = draw_clipped_line (
        sink, { 5, -5 }, { 5, 15 }, rectf_t{ 10, 10, 0, 0 },
        line_algorithm_t::dda, black);

    BOOST_TEST (n == 11U);
}

BOOST_AUTO_TEST_CASE(narrowed_to_sink) {
    //
    // A clip rect far larger than the sink is cut down to it, and so is the
    // line:
    //
    counting_sink_t sink (20, 20);

    const auto n = draw_clipped_line (
        sink, { -1e12, 5 }, { 1e12, 5 }, rectf_t{ -1e15, -1e15, 1e15, 1e15 },
        line_algorithm_t::bresenham, black);

    BOOST_TEST (n == 20U);
    BOOST_TEST (sink.sets == 20U);

    BOOST_TEST (bounds_of (sink) == (rectf_t{ -1, -1, 20, 20 }));
}

BOOST_AUTO_TEST_SUITE_END()
