// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RASTERKIT_UTILS_STRING_HH
#define RASTERKIT_UTILS_STRING_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

namespace rasterkit {

std::vector< std::string >
split (const std::string& s, const std::string& delims = " \t\r\n");

//
// Breaks a configuration or script line into whitespace-separated tokens.
// A token may be quoted with ' or " to hold blanks. A line starting with
// '#', or the text after a blank-separated '#', is a comment:
//
std::vector< std::string > tokenize (const std::string&);

//
// Strict numeric conversions, the whole token must be consumed:
//
std::optional< int >    to_int    (const std::string&);
std::optional< double > to_double (const std::string&);

// "yes" or "no"
std::optional< bool > to_yes_no (const std::string&);

} // namespace rasterkit

#endif // RASTERKIT_UTILS_STRING_HH
