// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_COLOR_HH
#define RASTERKIT_RASTERKIT_COLOR_HH

#include <defs.hh>

#include <cstdint>
#include <optional>
#include <string>

#include <rasterkit/math.hh>
#include <rasterkit/types.hh>

namespace rasterkit {

//
// Parses "#RRGGBB" into (R, G, B, 255), and "#RRGGBBAA" with an explicit
// alpha. Hex digits are case-insensitive and the leading '#' is optional:
//
std::optional< color_t > parse_color (const std::string&);

//
// The inverse of parse_color: "#rrggbb", or "#rrggbbaa" for a color that
// is not opaque:
//
std::string to_string (const color_t&);

inline color_t make_color (int r, int g, int b, int a = 255) {
    return color_t{ clamp255 (r), clamp255 (g), clamp255 (b), clamp255 (a) };
}

//
// True if every channel, alpha included, differs by at most <tolerance>:
//
inline bool
matches (const color_t& lhs, const color_t& rhs, int tolerance = 0) {
    auto near = [=](int a, int b) {
        return (a < b ? b - a : a - b) <= tolerance;
    };

    return
        near (lhs.r, rhs.r) && near (lhs.g, rhs.g) &&
        near (lhs.b, rhs.b) && near (lhs.a, rhs.a);
}

inline color_t with_alpha (color_t c, std::uint8_t a) {
    return c.a = a, c;
}

//
// Source-over compositing of <src> onto <dst>, 8-bit straight alpha:
//
color_t over (const color_t& src, const color_t& dst);

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_COLOR_HH
