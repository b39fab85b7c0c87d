// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RASTERKIT_UTILS_PATH_HH
#define RASTERKIT_UTILS_PATH_HH

#include <defs.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace rasterkit {

// Get home directory path.
fs::path home_path ();

// Shell-like expansion of `~' and environment variables, no commands.
fs::path expand_path (const fs::path&);

//
// A path named inside a file: expanded, and taken relative to the
// directory of that file unless absolute:
//
fs::path relative_to (const fs::path& path, const fs::path& file);

} // namespace rasterkit

#endif // RASTERKIT_UTILS_PATH_HH
