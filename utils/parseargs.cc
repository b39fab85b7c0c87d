// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <cstring>

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include <utils/error.hh>
#include <utils/parseargs.hh>
#include <utils/string.hh>

namespace rasterkit {
namespace {

const arg_desc_t* find_arg (const arg_desc_t* args, const char* arg) {
    for (auto p = args; p->arg; ++p) {
        if (0 == strcmp (p->arg, arg))
            return p;
    }

    return nullptr;
}

//
// Consumes argv [i] and, for an argument with a value, argv [i + 1]:
//
bool grab_arg (const arg_desc_t* p, int i, int* argc, char* argv []) {
    int n = 0;

    switch (p->kind) {
    case argFlag:
        *static_cast< bool* > (p->val) = true;
        n = 1;
        break;

    case argInt:
        if (i + 1 < *argc) {
            if (auto value = to_int (argv [i + 1])) {
                *static_cast< int* > (p->val) = *value;
                n = 2;
            }
        }
        break;

    case argFP:
        if (i + 1 < *argc) {
            if (auto value = to_double (argv [i + 1])) {
                *static_cast< double* > (p->val) = *value;
                n = 2;
            }
        }
        break;

    case argString:
        if (i + 1 < *argc) {
            *static_cast< std::string* > (p->val) = argv [i + 1];
            n = 2;
        }
        break;

    default:
        error (errInternal, "invalid argument descriptor for '{}'", p->arg);
        return false;
    }

    if (0 == n) {
        error (errCommandLine, "missing or invalid value for '{}'", p->arg);
        return false;
    }

    *argc -= n;

    for (int j = i; j <= *argc; ++j)
        argv [j] = argv [j + n];

    return true;
}

} // anonymous

bool parse_args (const arg_desc_t* args, int* argc, char* argv []) {
    bool ok = true;

    for (int i = 1; i < *argc;) {
        if (0 == strcmp (argv [i], "--")) {
            --*argc;

            for (int j = i; j <= *argc; ++j)
                argv [j] = argv [j + 1];

            break;
        }
        else if (auto p = find_arg (args, argv [i])) {
            ok = grab_arg (p, i, argc, argv) && ok;

            if (!ok)
                break;
        }
        else {
            ++i;
        }
    }

    return ok;
}

void print_usage (
    const char* program, const char* other_args, const arg_desc_t* args) {
    size_t width = 0;

    for (auto p = args; p->arg; ++p) {
        width = (std::max) (width, strlen (p->arg));
    }

    fmt::print (
        stderr, "Usage: {} [options]{}{}\n",
        program, other_args ? " " : "", other_args ? other_args : "");

    for (auto p = args; p->arg; ++p) {
        const char* typ = "";

        switch (p->kind) {
        case argInt:    case argIntDummy:    typ = " <int>";    break;
        case argFP:     case argFPDummy:     typ = " <fp>";     break;
        case argString: case argStringDummy: typ = " <string>"; break;
        default: break;
        }

        const std::string head = std::string (p->arg) + typ;

        fmt::print (
            stderr, "  {:<{}} : {}\n", head, width + 9, p->usage ? p->usage : "");
    }
}

} // namespace rasterkit
