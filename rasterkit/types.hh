// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_TYPES_HH
#define RASTERKIT_RASTERKIT_TYPES_HH

#include <defs.hh>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <tuple>
#include <type_traits>
#include <utility>

namespace rasterkit {

namespace detail {

template< typename T >
struct point_t {
    using value_type = T;
    value_type x, y;
};

template< typename T >
inline bool
operator== (const point_t< T >& lhs, const point_t< T >& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

template< typename T >
inline bool
operator!= (const point_t< T >& lhs, const point_t< T >& rhs) {
    return !(lhs == rhs);
}

//
// Lexicographic, row first; lets pixel sets be sorted and compared:
//
template< typename T >
inline bool
operator< (const point_t< T >& lhs, const point_t< T >& rhs) {
    return std::tie (lhs.y, lhs.x) < std::tie (rhs.y, rhs.x);
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const point_t< T >& p) {
    return ss << "(" << p.x << "," << p.y << ")";
}

//
// Clip rectangle, described by its minimum and maximum corners. Unlike the
// half-open bitmap extent, both bounds are inclusive:
//
template< typename T >
struct rect_t {
    using value_type = T;
    value_type x_min, y_min, x_max, y_max;
};

template< typename T >
inline bool
operator== (const rect_t< T >& lhs, const rect_t< T >& rhs) {
    return
        lhs.x_min == rhs.x_min && lhs.y_min == rhs.y_min &&
        lhs.x_max == rhs.x_max && lhs.y_max == rhs.y_max;
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const rect_t< T >& r) {
    return ss
        << r.x_min << "," << r.y_min << ","
        << r.x_max << "," << r.y_max;
}

template< typename T >
inline rect_t< T >
normalize (rect_t< T > r) {
    if (r.x_min > r.x_max) { std::swap (r.x_min, r.x_max); }
    if (r.y_min > r.y_max) { std::swap (r.y_min, r.y_max); }
    return r;
}

template< typename T, typename U >
inline bool
contains (const rect_t< T >& r, const point_t< U >& p) {
    return
        r.x_min <= p.x && p.x <= r.x_max &&
        r.y_min <= p.y && p.y <= r.y_max;
}

template< typename T >
inline bool
is_empty (const rect_t< T >& r) {
    return r.x_min > r.x_max || r.y_min > r.y_max;
}

//
// The common part of two normalized rectangles; empty if they are disjoint:
//
template< typename T >
inline rect_t< T >
intersection (const rect_t< T >& a, const rect_t< T >& b) {
    return rect_t< T >{
        (std::max) (a.x_min, b.x_min), (std::max) (a.y_min, b.y_min),
        (std::min) (a.x_max, b.x_max), (std::min) (a.y_max, b.y_max)
    };
}

} // namespace detail

////////////////////////////////////////////////////////////////////////

using pointi_t = detail::point_t< int >;
using pointf_t = detail::point_t< double >;

using recti_t = detail::rect_t< int >;
using rectf_t = detail::rect_t< double >;

using detail::normalize;
using detail::contains;
using detail::intersection;
using detail::is_empty;

template<
    typename T, typename U,
    typename std::enable_if_t< std::is_constructible_v< T, U > >* = nullptr
    >
inline detail::point_t< T >
to (const detail::point_t< U >& p) {
    return detail::point_t< T >{ T (p.x), T (p.y) };
}

template<
    typename T, typename U,
    typename std::enable_if_t< std::is_constructible_v< T, U > >* = nullptr
    >
inline detail::rect_t< T >
to (const detail::rect_t< U >& r) {
    return detail::rect_t< T >{
        T (r.x_min), T (r.y_min), T (r.x_max), T (r.y_max)
    };
}

////////////////////////////////////////////////////////////////////////

struct color_t {
    std::uint8_t r, g, b, a = 255;
};

inline bool operator== (const color_t& lhs, const color_t& rhs) {
    return
        lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

inline bool operator!= (const color_t& lhs, const color_t& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<< (std::ostream&, const color_t&);

//
// Transparent black, what a sink answers for a pixel outside its extent:
//
inline constexpr color_t transparent{ 0, 0, 0, 0 };

////////////////////////////////////////////////////////////////////////

//
// One pixel write. Anti-aliased rasterizers carry the coverage in the
// alpha channel of the color:
//
struct pixel_t {
    int x, y;
    color_t color;

    pointi_t point () const { return { x, y }; }
};

inline bool operator== (const pixel_t& lhs, const pixel_t& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.color == rhs.color;
}

inline bool operator!= (const pixel_t& lhs, const pixel_t& rhs) {
    return !(lhs == rhs);
}

inline std::ostream&
operator<< (std::ostream& ss, const pixel_t& p) {
    return ss << "(" << p.x << "," << p.y << ")=" << p.color;
}

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_TYPES_HH
