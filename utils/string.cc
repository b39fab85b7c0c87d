// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

#include <string>
#include <vector>

#include <utils/string.hh>

namespace rasterkit {

std::vector< std::string >
split (const std::string& s, const std::string& delims) {
    std::vector< std::string > xs;

    for (size_t first = 0, second; first < s.size (); first = second + 1) {
        second = s.find_first_of (delims, first);

        if (first != second)
            xs.emplace_back (s.substr (first, second - first));

        if (second == std::string::npos)
            break;
    }

    return xs;
}

std::vector< std::string > tokenize (const std::string& s) {
    std::vector< std::string > xs;

    auto iter = s.begin (), last = s.end ();

    for (;;) {
        for (; iter != last && std::isspace ((unsigned char)*iter); ++iter) ;

        if (iter == last)
            break;

        //
        // A comment: a `#' opening the line, or a lone `#' after a token.
        // Anything else starting with `#' is a token, e.g., a color:
        //
        if (*iter == '#' && (
                xs.empty () || iter + 1 == last ||
                std::isspace ((unsigned char)iter [1])))
            break;

        auto first = iter;

        if (*iter == '"' || *iter == '\'') {
            const auto quote = *iter;

            for (++first, ++iter; iter != last && *iter != quote; ++iter) ;
            xs.emplace_back (first, iter);

            if (iter != last)
                ++iter;
        }
        else {
            for (; iter != last && !std::isspace ((unsigned char)*iter); ++iter) ;
            xs.emplace_back (first, iter);
        }
    }

    return xs;
}

std::optional< int > to_int (const std::string& s) {
    if (s.empty ())
        return { };

    char* end = nullptr;

    errno = 0;
    const long value = std::strtol (s.c_str (), &end, 10);

    if (errno || *end || value < INT_MIN || value > INT_MAX)
        return { };

    return int (value);
}

std::optional< double > to_double (const std::string& s) {
    if (s.empty ())
        return { };

    char* end = nullptr;

    errno = 0;
    const double value = std::strtod (s.c_str (), &end);

    if (errno || *end)
        return { };

    return value;
}

std::optional< bool > to_yes_no (const std::string& s) {
    if (s == "yes")
        return true;
    else if (s == "no")
        return false;

    return { };
}

} // namespace rasterkit
