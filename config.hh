// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_CONFIG_HH
#define RASTERKIT_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "rasterkit"
#define PACKAGE_NAME "rasterkit"
#define PACKAGE_STRING "rasterkit 0.1.0"
#define PACKAGE_TARNAME "rasterkit"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.1.0"
#define VERSION "0.1.0"

#define RASTERKIT_COPYRIGHT "Copyright 2019-2020 Thinkoid, LLC"

//------------------------------------------------------------------------
// engine defaults
//------------------------------------------------------------------------

// number of parameter steps for a Bezier curve when no adaptive policy
// is requested
#define RASTERKIT_CURVE_STEPS 100

// multiplier applied to the rough control polygon length by the adaptive
// Bezier step policy
#define RASTERKIT_CURVE_STEP_FACTOR 2.0

// upper bound on the number of parameter steps of a Bezier curve
#define RASTERKIT_MAX_CURVE_STEPS 65536

// largest coordinate magnitude, in pixels, the rasterizers accept
#define RASTERKIT_MAX_COORDINATE (1 << 24)

// largest brush width, in pixels
#define RASTERKIT_MAX_STROKE_WIDTH 64

// name of the per-user configuration file, looked up in $HOME
#define RASTERKIT_RC_FILE ".rasterkitrc"

#endif // RASTERKIT_CONFIG_HH
