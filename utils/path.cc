// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>

#include <memory>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#include <wordexp.h>

#include <utils/path.hh>

namespace rasterkit {

fs::path home_path () {
    if (const char* s = getenv ("HOME")) {
        return fs::path (s);
    }
    else {
        struct passwd* p = 0;

        if (const char* s = getenv ("USER"))
            p = getpwnam (s);
        else
            p = getpwuid (getuid ());

        return p ? fs::path (p->pw_dir) : fs::path (".");
    }
}

fs::path expand_path (const fs::path& path) {
    wordexp_t w{ };

    std::unique_ptr< ::wordexp_t, void (*)(::wordexp_t*) > guard (
        &w, ::wordfree);

    int result = wordexp (
        path.c_str (), &w, WRDE_NOCMD | WRDE_SHOWERR | WRDE_UNDEF);

    if (0 == result && 1 == w.we_wordc)
        return fs::path (w.we_wordv [0]);

    return path;
}

fs::path relative_to (const fs::path& path, const fs::path& file) {
    auto expanded = expand_path (path);

    if (expanded.is_absolute ())
        return expanded;

    return file.parent_path () / expanded;
}

} // namespace rasterkit
