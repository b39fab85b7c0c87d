// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RASTERKIT_UTILS_ERROR_HH
#define RASTERKIT_UTILS_ERROR_HH

#include <defs.hh>

#include <functional>
#include <string>

#include <fmt/format.h>

namespace rasterkit {

enum error_category_t {
    errSyntaxWarning,   // script or color text is suspicious, but
                        //   processing continues
    errSyntaxError,     // script or color text is malformed
    errGeometry,        // a geometric request violates its contract
                        //   (negative radius, too few control points,
                        //   seed outside the bitmap)
    errConfig,          // problem in the configuration file
    errCommandLine,     // invalid command line argument
    errIO,              // read/write error
    errInternal         // internal error, malfunction within rasterkit
};

const char* to_string (error_category_t);

using error_callback_t = std::function< void (error_category_t, const std::string&) >;

//
// Replaces the message sink; an empty callback restores the default, which
// writes "<category>: <message>" lines to stderr. Returns the previous one:
//
error_callback_t set_error_callback (error_callback_t);

//
// Quiet mode drops every message; warnings are only printed when verbose:
//
void set_error_quiet (bool);
void set_error_verbose (bool);

void error_v (error_category_t, const std::string&);

template< typename ... Args >
inline void
error (error_category_t category, const char* msg, const Args& ... args) {
    error_v (category, fmt::vformat (msg, fmt::make_format_args (args...)));
}

} // namespace rasterkit

#endif // RASTERKIT_UTILS_ERROR_HH
