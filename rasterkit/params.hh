// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_RASTERKIT_PARAMS_HH
#define RASTERKIT_RASTERKIT_PARAMS_HH

#include <defs.hh>

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include <rasterkit/curve.hh>
#include <rasterkit/fill.hh>
#include <rasterkit/line.hh>
#include <rasterkit/paint.hh>

namespace rasterkit {

//------------------------------------------------------------------------
// params_t
//------------------------------------------------------------------------

//
// Engine defaults, read from a configuration file of the form:
//
//   # comment
//   lineAlgorithm    wu
//   fillAlgorithm    span
//   fillTolerance    8
//   curveSteps       adaptive
//   curveStepFactor  2.5
//   curveDedup       yes
//   blendMode        over
//   strokeWidth      3
//   quiet            no
//   verbose          yes
//   include          "other file"
//
// Malformed lines are reported and skipped; they never abort the parse.
//
class params_t {
public:
    // Built-in defaults.
    params_t ();

    //
    // Defaults, then the named file; if the name is empty, the per-user
    // file in $HOME, when there is one:
    //
    explicit params_t (const std::string& filename);

    // Returns false if the file can't be opened.
    bool parse_file (const std::string& filename);

    void parse (std::istream&, const std::string& filename);

    void parse_line (const std::string&, const std::string& filename, int line);

    //----- accessors

    line_algorithm_t get_line_algorithm () const { return line_algorithm; }
    fill_algorithm_t get_fill_algorithm () const { return fill_algorithm; }

    int get_fill_tolerance () const { return fill_tolerance; }

    const curve_steps_t& get_curve_steps () const { return curve_steps; }

    blend_t get_blend () const { return blend; }

    int get_stroke_width () const { return stroke_width; }

    bool get_quiet () const { return quiet; }
    bool get_verbose () const { return verbose; }

    //----- functions to set parameters, false on a bad value

    bool set_line_algorithm (const std::string&);
    bool set_fill_algorithm (const std::string&);
    bool set_fill_tolerance (int);
    bool set_curve_steps (const std::string&);
    bool set_curve_step_factor (double);
    bool set_blend (const std::string&);
    bool set_stroke_width (int);

    void set_curve_dedup (bool b) { curve_steps.dedup = b; }

    void set_quiet (bool b) { quiet = b; }
    void set_verbose (bool b) { verbose = b; }

private:
    using tokens_type = std::vector< std::string >;

    void parse_include (const tokens_type&, const std::string&, int);

    template< typename Setter >
    void parse_string (
        const char*, Setter, const tokens_type&, const std::string&, int);

    void parse_yes_no (
        const char*, bool*, const tokens_type&, const std::string&, int);

    void parse_integer (
        const char*, int*, const tokens_type&, const std::string&, int);

    void parse_float (
        const char*, double*, const tokens_type&, const std::string&, int);

private:
    line_algorithm_t line_algorithm; // lineAlgorithm
    fill_algorithm_t fill_algorithm; // fillAlgorithm

    int fill_tolerance;              // fillTolerance, in [0, 255]

    curve_steps_t curve_steps;       // curveSteps, curveStepFactor,
                                     //   curveDedup
    blend_t blend;                   // blendMode

    int stroke_width;                // strokeWidth, in
                                     //   [1, RASTERKIT_MAX_STROKE_WIDTH]

    bool quiet;                      // suppress all messages
    bool verbose;                    // also print warnings

    int depth;                       // include nesting depth
};

//
// Process-wide parameters, installed by the program:
//
extern std::unique_ptr< params_t > params;

} // namespace rasterkit

#endif // RASTERKIT_RASTERKIT_PARAMS_HH
