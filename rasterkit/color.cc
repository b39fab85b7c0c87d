// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cctype>
#include <iostream>
#include <optional>
#include <string>

#include <fmt/format.h>
using fmt::format;

#include <rasterkit/color.hh>
#include <rasterkit/math.hh>

namespace rasterkit {
namespace {

inline int hex_digit_of (char c) {
    if ('0' <= c && c <= '9')
        return c - '0';

    c = char (std::tolower ((unsigned char)c));

    if ('a' <= c && c <= 'f')
        return c - 'a' + 10;

    return -1;
}

inline std::optional< std::uint8_t >
hex_byte_of (const std::string& s, size_t pos) {
    const int hi = hex_digit_of (s [pos]), lo = hex_digit_of (s [pos + 1]);

    if (hi < 0 || lo < 0)
        return { };

    return std::uint8_t (hi * 16 + lo);
}

} // anonymous

std::optional< color_t > parse_color (const std::string& text) {
    const size_t off = !text.empty () && text [0] == '#' ? 1 : 0;
    const size_t n = text.size () - off;

    if (n != 6 && n != 8)
        return { };

    color_t c;

    auto r = hex_byte_of (text, off);
    auto g = hex_byte_of (text, off + 2);
    auto b = hex_byte_of (text, off + 4);

    if (!r || !g || !b)
        return { };

    c = { *r, *g, *b };

    if (n == 8) {
        auto a = hex_byte_of (text, off + 6);

        if (!a)
            return { };

        c.a = *a;
    }

    return c;
}

std::string to_string (const color_t& c) {
    return c.a == 255
        ? format ("#{:02x}{:02x}{:02x}", c.r, c.g, c.b)
        : format ("#{:02x}{:02x}{:02x}{:02x}", c.r, c.g, c.b, c.a);
}

std::ostream& operator<< (std::ostream& ss, const color_t& c) {
    return ss << to_string (c);
}

color_t over (const color_t& src, const color_t& dst) {
    if (src.a == 255 || dst.a == 0)
        return src;

    if (src.a == 0)
        return dst;

    //
    // Straight alpha: ao = as + ad (1 - as), co = (cs as + cd ad (1 - as)) / ao
    //
    const int as = src.a, ad = mul255 (dst.a, std::uint8_t (255 - src.a));
    const int ao = as + ad;

    auto blend = [=](int cs, int cd) {
        return (cs * as + cd * ad + ao / 2) / ao;
    };

    return make_color (
        blend (src.r, dst.r), blend (src.g, dst.g), blend (src.b, dst.b), ao);
}

} // namespace rasterkit
