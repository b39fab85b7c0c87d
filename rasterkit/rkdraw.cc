// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cstdio>
#include <cstdlib>

#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <fmt/format.h>

#include <rasterkit/bitmap.hh>
#include <rasterkit/color.hh>
#include <rasterkit/params.hh>
#include <rasterkit/script.hh>
#include <utils/error.hh>
#include <utils/parseargs.hh>

using namespace rasterkit;

static int width = 256;
static int height = 256;
static std::string background = "#ffffff";
static std::string alphaFileName;
static std::string cfgFileName;
static bool quiet = false;
static bool printVersion = false;
static bool printHelp = false;

static const arg_desc_t argDesc [] = {
    { "-w", argInt, &width, "bitmap width, in pixels (default 256)" },
    { "-h", argInt, &height, "bitmap height, in pixels (default 256)" },
    { "-bg", argString, &background,
      "background color, #RRGGBB[AA] (default #ffffff)" },
    { "-alpha", argString, &alphaFileName,
      "also write the alpha channel to this PGM file" },
    { "-cfg", argString, &cfgFileName,
      "configuration file to use in place of ~/" RASTERKIT_RC_FILE },
    { "-q", argFlag, &quiet, "don't print any messages or errors" },
    { "-v", argFlag, &printVersion, "print copyright and version info" },
    { "-help", argFlag, &printHelp, "print usage information" },
    { "--help", argFlag, &printHelp, "print usage information" },
    { "-?", argFlag, &printHelp, "print usage information" },
    { }
};

int main (int argc, char* argv []) {
    const bool ok = parse_args (argDesc, &argc, argv);

    if (!ok || argc != 3 || printVersion || printHelp) {
        fmt::print (stderr, "rkdraw version {}\n", PACKAGE_VERSION);
        fmt::print (stderr, "{}\n", RASTERKIT_COPYRIGHT);

        if (!printVersion) {
            print_usage ("rkdraw", "<script-file> <PPM-file>", argDesc);
        }

        return !ok || (!printVersion && !printHelp) ? 99 : 0;
    }

    const std::string scriptFileName (argv [1]), outFileName (argv [2]);

    set_error_quiet (quiet);

    params = std::make_unique< params_t > (cfgFileName);

    if (quiet) {
        params->set_quiet (true);
    }

    set_error_quiet (params->get_quiet ());
    set_error_verbose (params->get_verbose ());

    if (width <= 0 || height <= 0) {
        error (errCommandLine, "invalid bitmap size {}x{}", width, height);
        return 99;
    }

    const auto bg = parse_color (background);

    if (!bg) {
        error (errCommandLine, "invalid background color '{}'", background);
        return 99;
    }

    bitmap_t bitmap (width, height, *bg);
    script_t script (bitmap, *params);

    try {
        if (scriptFileName == "-") {
            script.run (std::cin, "<stdin>");
        }
        else {
            std::ifstream f (scriptFileName);

            if (!f) {
                error (errIO, "couldn't open script file '{}'", scriptFileName);
                return 1;
            }

            script.run (f, scriptFileName);
        }
    }
    catch (const std::exception& e) {
        error (errSyntaxError, "{}", e.what ());
        return 2;
    }

    if (!bitmap.write_pnm (outFileName)) {
        return 3;
    }

    if (!alphaFileName.empty () && !bitmap.write_alpha_pgm (alphaFileName)) {
        return 3;
    }

    return 0;
}
