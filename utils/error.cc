// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>

#include <string>
#include <utility>

#include <utils/error.hh>

namespace rasterkit {
namespace {

struct error_state_t {
    error_callback_t callback;
    bool quiet = false, verbose = false;
};

error_state_t& state () {
    static error_state_t s;
    return s;
}

} // anonymous

const char* to_string (error_category_t category) {
    switch (category) {
    case errSyntaxWarning: return "Syntax Warning";
    case errSyntaxError:   return "Syntax Error";
    case errGeometry:      return "Geometry Error";
    case errConfig:        return "Config Error";
    case errCommandLine:   return "Command Line Error";
    case errIO:            return "I/O Error";
    case errInternal:      return "Internal Error";
    }

    return "Error";
}

error_callback_t set_error_callback (error_callback_t callback) {
    return std::exchange (state ().callback, std::move (callback));
}

void set_error_quiet (bool b) { state ().quiet = b; }

void set_error_verbose (bool b) { state ().verbose = b; }

void error_v (error_category_t category, const std::string& msg) {
    auto& s = state ();

    //
    // The callback sees everything; the console only what the user asked
    // for:
    //
    if (s.callback) {
        s.callback (category, msg);
        return;
    }

    if (s.quiet || (category == errSyntaxWarning && !s.verbose)) {
        return;
    }

    fmt::print (stderr, "{}: {}\n", to_string (category), msg);
    fflush (stderr);
}

} // namespace rasterkit
