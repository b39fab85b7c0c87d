// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>
#include <istream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
using fmt::format;

#include <rasterkit/circle.hh>
#include <rasterkit/clip.hh>
#include <rasterkit/color.hh>
#include <rasterkit/curve.hh>
#include <rasterkit/fill.hh>
#include <rasterkit/line.hh>
#include <rasterkit/paint.hh>
#include <rasterkit/script.hh>
#include <rasterkit/shape.hh>
#include <utils/string.hh>

namespace rasterkit {
namespace {

//
// Thrown from the helpers below, without position; script_t::execute adds
// the script name and line:
//
struct bad_command_t : std::runtime_error {
    using std::runtime_error::runtime_error;
};

double number_at (const std::vector< std::string >& tokens, size_t i) {
    if (auto value = to_double (tokens [i]))
        return *value;

    throw bad_command_t (format ("invalid number '{}'", tokens [i]));
}

int integer_at (const std::vector< std::string >& tokens, size_t i) {
    if (auto value = to_int (tokens [i]))
        return *value;

    throw bad_command_t (format ("invalid integer '{}'", tokens [i]));
}

pointf_t point_at (const std::vector< std::string >& tokens, size_t i) {
    return { number_at (tokens, i), number_at (tokens, i + 1) };
}

//
// The coordinate pairs from tokens [first] on, at least <least> of them:
//
std::vector< pointf_t >
points_from (const std::vector< std::string >& tokens, size_t first,
             size_t least) {
    const size_t n = tokens.size () - first;

    if (n % 2 || n / 2 < least) {
        throw bad_command_t (format (
            "'{}' takes an even number of coordinates, at least {}",
            tokens [0], 2 * least));
    }

    std::vector< pointf_t > ps;

    for (size_t i = first; i < tokens.size (); i += 2)
        ps.push_back (point_at (tokens, i));

    return ps;
}

void expect_arity (const std::vector< std::string >& tokens, size_t n) {
    if (tokens.size () != n + 1) {
        throw bad_command_t (format (
            "'{}' takes {} arguments, got {}",
            tokens [0], n, tokens.size () - 1));
    }
}

} // anonymous

script_t::script_t (sink_t& sink, const params_t& params)
    : sink (sink), params (params), color{ 0, 0, 0 },
      width (params.get_stroke_width ()), writes (0)
{ }

void script_t::run (std::istream& f, const std::string& name) {
    std::string buf;

    for (int line = 1; std::getline (f, buf); ++line) {
        if (!buf.empty () && buf.back () == '\r')
            buf.pop_back ();

        execute (buf, name, line);
    }
}

void script_t::execute (
    const std::string& buf, const std::string& name, int lineno) {
    const auto tokens = tokenize (buf);

    if (tokens.empty ())
        return;

    const auto& cmd = tokens [0];

    try {
        if (cmd == "color") {
            expect_arity (tokens, 1);

            auto value = parse_color (tokens [1]);

            if (!value)
                throw bad_command_t (format ("invalid color '{}'", tokens [1]));

            color = *value;
        }
        else if (cmd == "line") {
            draw_line (params.get_line_algorithm (), tokens);
        }
        else if (auto algorithm = to_line_algorithm (cmd)) {
            draw_line (*algorithm, tokens);
        }
        else if (cmd == "circle") {
            expect_arity (tokens, 3);

            const pointi_t center{ integer_at (tokens, 1), integer_at (tokens, 2) };

            writes += draw_circle (
                sink, center, integer_at (tokens, 3), color, params.get_blend (),
                width);
        }
        else if (cmd == "quad") {
            expect_arity (tokens, 6);

            stroke (quadratic_bezier (
                point_at (tokens, 1), point_at (tokens, 3),
                point_at (tokens, 5), color, params.get_curve_steps ()));
        }
        else if (cmd == "cubic") {
            expect_arity (tokens, 8);

            stroke (cubic_bezier (
                point_at (tokens, 1), point_at (tokens, 3),
                point_at (tokens, 5), point_at (tokens, 7), color,
                params.get_curve_steps ()));
        }
        else if (cmd == "bezier") {
            writes += draw_bezier (
                sink, points_from (tokens, 1, 2), color,
                params.get_curve_steps (), params.get_blend (), width);
        }
        else if (cmd == "rect") {
            expect_arity (tokens, 4);

            draw_polyline (
                rectangle_vertices (point_at (tokens, 1), point_at (tokens, 3)),
                true);
        }
        else if (cmd == "triangle") {
            expect_arity (tokens, 4);

            draw_polyline (
                triangle_vertices (point_at (tokens, 1), point_at (tokens, 3)),
                true);
        }
        else if (cmd == "polyline") {
            draw_polyline (points_from (tokens, 1, 2), false);
        }
        else if (cmd == "polygon") {
            draw_polyline (points_from (tokens, 1, 3), true);
        }
        else if (cmd == "star") {
            if (tokens.size () != 4 && tokens.size () != 5) {
                throw bad_command_t ("'star' takes 3 or 4 arguments");
            }

            const int tips = tokens.size () == 5 ? integer_at (tokens, 4) : 5;

            if (tips < 2)
                throw bad_command_t (
                    format ("a star needs at least 2 tips, got {}", tips));

            draw_polyline (
                star_vertices (point_at (tokens, 1), number_at (tokens, 3), tips),
                true);
        }
        else if (cmd == "heart") {
            expect_arity (tokens, 3);

            const pointi_t center{ integer_at (tokens, 1), integer_at (tokens, 2) };

            writes += draw_heart (
                sink, params.get_line_algorithm (), center,
                integer_at (tokens, 3), color, params.get_blend (), width, clip);
        }
        else if (cmd == "fill") {
            if (tokens.size () != 3 && tokens.size () != 4) {
                throw bad_command_t ("'fill' takes 2 or 3 arguments");
            }

            const pointi_t seed{ integer_at (tokens, 1), integer_at (tokens, 2) };

            const int tolerance = tokens.size () == 4
                ? integer_at (tokens, 3) : params.get_fill_tolerance ();

            if (tolerance < 0 || tolerance > 255) {
                throw bad_command_t (
                    format ("fill tolerance {} is not in [0, 255]", tolerance));
            }

            writes += fill (
                params.get_fill_algorithm (), sink, seed, color,
                tolerance).size ();
        }
        else if (cmd == "width") {
            expect_arity (tokens, 1);

            const int n = integer_at (tokens, 1);

            if (n < 1 || n > RASTERKIT_MAX_STROKE_WIDTH) {
                throw bad_command_t (format (
                    "stroke width {} is not in [1, {}]",
                    n, RASTERKIT_MAX_STROKE_WIDTH));
            }

            width = n;
        }
        else if (cmd == "clip") {
            expect_arity (tokens, 4);

            clip = normalize (rectf_t{
                number_at (tokens, 1), number_at (tokens, 2),
                number_at (tokens, 3), number_at (tokens, 4) });
        }
        else if (cmd == "noclip") {
            expect_arity (tokens, 0);
            clip.reset ();
        }
        else {
            throw bad_command_t (format ("unknown command '{}'", cmd));
        }
    }
    catch (const bad_command_t& e) {
        throw std::runtime_error (format ("{}:{}: {}", name, lineno, e.what ()));
    }
}

void script_t::draw_line (line_algorithm_t algorithm, const tokens_type& tokens) {
    expect_arity (tokens, 4);

    const auto p0 = point_at (tokens, 1), p1 = point_at (tokens, 3);

    if (clip) {
        writes += draw_clipped_line (
            sink, p0, p1, *clip, algorithm, color, params.get_blend (), width);
    }
    else {
        writes += rasterkit::draw_line (
            sink, algorithm, p0, p1, color, params.get_blend (), width);
    }
}

void script_t::draw_polyline (const std::vector< pointf_t >& ps, bool closed) {
    writes += rasterkit::draw_polyline (
        sink, params.get_line_algorithm (), ps, color, closed,
        params.get_blend (), width, clip);
}

void script_t::stroke (const std::vector< pixel_t >& xs) {
    const auto area = bounds_of (sink, width);

    std::vector< pixel_t > ys;

    std::copy_if (xs.begin (), xs.end (), std::back_inserter (ys), [&](auto& x) {
        return contains (area, x.point ());
    });

    writes += paint (sink, widen (ys, width), params.get_blend ());
}

} // namespace rasterkit
