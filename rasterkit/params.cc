// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <rasterkit/params.hh>
#include <utils/error.hh>
#include <utils/path.hh>
#include <utils/string.hh>

namespace rasterkit {

std::unique_ptr< params_t > params;

//------------------------------------------------------------------------

namespace {

// Bound on `include' nesting, which also stops include cycles.
const int max_include_depth = 8;

} // anonymous

//------------------------------------------------------------------------
// params_t
//------------------------------------------------------------------------

params_t::params_t ()
    : line_algorithm (line_algorithm_t::bresenham),
      fill_algorithm (fill_algorithm_t::stack),
      fill_tolerance (0),
      curve_steps (),
      blend (blend_t::replace),
      stroke_width (1),
      quiet (false),
      verbose (false),
      depth (0)
{ }

params_t::params_t (const std::string& filename) : params_t () {
    if (!filename.empty ()) {
        if (!parse_file (filename)) {
            error (errConfig, "couldn't open config file '{}'", filename);
        }
    }
    else {
        const auto path = home_path () / RASTERKIT_RC_FILE;

        if (fs::exists (path)) {
            parse_file (path.native ());
        }
    }
}

bool params_t::parse_file (const std::string& filename) {
    std::ifstream f (filename);

    if (!f)
        return false;

    parse (f, filename);

    return true;
}

void params_t::parse (std::istream& f, const std::string& filename) {
    std::string buf;

    for (int line = 1; std::getline (f, buf); ++line) {
        if (!buf.empty () && buf.back () == '\r')
            buf.pop_back ();

        parse_line (buf, filename, line);
    }
}

void params_t::parse_line (
    const std::string& buf, const std::string& filename, int line) {
    const auto tokens = tokenize (buf);

    if (tokens.empty ())
        return;

    const auto& cmd = tokens [0];

    if (cmd == "include") {
        parse_include (tokens, filename, line);
    }
    else if (cmd == "lineAlgorithm") {
        parse_string (
            "lineAlgorithm", &params_t::set_line_algorithm, tokens, filename,
            line);
    }
    else if (cmd == "fillAlgorithm") {
        parse_string (
            "fillAlgorithm", &params_t::set_fill_algorithm, tokens, filename,
            line);
    }
    else if (cmd == "fillTolerance") {
        int value = fill_tolerance;
        parse_integer ("fillTolerance", &value, tokens, filename, line);

        if (!set_fill_tolerance (value)) {
            error (
                errConfig, "Bad 'fillTolerance' config file command ({}:{})",
                filename, line);
        }
    }
    else if (cmd == "curveSteps") {
        parse_string (
            "curveSteps", &params_t::set_curve_steps, tokens, filename, line);
    }
    else if (cmd == "curveStepFactor") {
        double value = curve_steps.factor;
        parse_float ("curveStepFactor", &value, tokens, filename, line);

        if (!set_curve_step_factor (value)) {
            error (
                errConfig, "Bad 'curveStepFactor' config file command ({}:{})",
                filename, line);
        }
    }
    else if (cmd == "curveDedup") {
        parse_yes_no ("curveDedup", &curve_steps.dedup, tokens, filename, line);
    }
    else if (cmd == "blendMode") {
        parse_string (
            "blendMode", &params_t::set_blend, tokens, filename, line);
    }
    else if (cmd == "strokeWidth") {
        int value = stroke_width;
        parse_integer ("strokeWidth", &value, tokens, filename, line);

        if (!set_stroke_width (value)) {
            error (
                errConfig, "Bad 'strokeWidth' config file command ({}:{})",
                filename, line);
        }
    }
    else if (cmd == "quiet") {
        parse_yes_no ("quiet", &quiet, tokens, filename, line);
    }
    else if (cmd == "verbose") {
        parse_yes_no ("verbose", &verbose, tokens, filename, line);
    }
    else {
        error (
            errConfig, "Unknown config file command '{}' ({}:{})",
            cmd, filename, line);
    }
}

void params_t::parse_include (
    const tokens_type& tokens, const std::string& filename, int line) {
    if (tokens.size () != 2) {
        error (
            errConfig, "Bad 'include' config file command ({}:{})",
            filename, line);
        return;
    }

    if (depth >= max_include_depth) {
        error (
            errConfig, "Config file includes nested too deeply ({}:{})",
            filename, line);
        return;
    }

    const auto path = relative_to (tokens [1], filename);

    ++depth;
    const bool ok = parse_file (path.native ());
    --depth;

    if (!ok) {
        error (
            errConfig, "Couldn't find included config file: '{}' ({}:{})",
            path.native (), filename, line);
    }
}

template< typename Setter >
void params_t::parse_string (
    const char* cmd, Setter setter, const tokens_type& tokens,
    const std::string& filename, int line) {
    if (tokens.size () != 2 || !(this->*setter) (tokens [1])) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, line);
    }
}

void params_t::parse_yes_no (
    const char* cmd, bool* flag, const tokens_type& tokens,
    const std::string& filename, int line) {
    std::optional< bool > value;

    if (tokens.size () == 2)
        value = to_yes_no (tokens [1]);

    if (!value) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, line);
        return;
    }

    *flag = *value;
}

void params_t::parse_integer (
    const char* cmd, int* val, const tokens_type& tokens,
    const std::string& filename, int line) {
    std::optional< int > value;

    if (tokens.size () == 2)
        value = to_int (tokens [1]);

    if (!value) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, line);
        return;
    }

    *val = *value;
}

void params_t::parse_float (
    const char* cmd, double* val, const tokens_type& tokens,
    const std::string& filename, int line) {
    std::optional< double > value;

    if (tokens.size () == 2)
        value = to_double (tokens [1]);

    if (!value) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, line);
        return;
    }

    *val = *value;
}

//------------------------------------------------------------------------

bool params_t::set_line_algorithm (const std::string& s) {
    if (auto value = to_line_algorithm (s))
        return line_algorithm = *value, true;

    return false;
}

bool params_t::set_fill_algorithm (const std::string& s) {
    if (auto value = to_fill_algorithm (s))
        return fill_algorithm = *value, true;

    return false;
}

bool params_t::set_fill_tolerance (int n) {
    if (n < 0 || n > 255)
        return false;

    fill_tolerance = n;
    return true;
}

bool params_t::set_curve_steps (const std::string& s) {
    if (s == "adaptive") {
        curve_steps.policy = curve_steps_t::policy_t::adaptive;
        return true;
    }

    const auto n = to_int (s);

    if (!n || *n <= 0)
        return false;

    curve_steps.policy = curve_steps_t::policy_t::fixed;
    curve_steps.count = *n;

    return true;
}

bool params_t::set_curve_step_factor (double x) {
    if (!(x > 0.))
        return false;

    curve_steps.factor = x;
    return true;
}

bool params_t::set_blend (const std::string& s) {
    if (auto value = to_blend (s))
        return blend = *value, true;

    return false;
}

bool params_t::set_stroke_width (int n) {
    if (n < 1 || n > RASTERKIT_MAX_STROKE_WIDTH)
        return false;

    stroke_width = n;
    return true;
}

} // namespace rasterkit
