// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_DEFS_HH
#define RASTERKIT_DEFS_HH

#include <config.hh>

#define TO_S(x) #x

#define RASTERKIT_DO_CAT(a, b) a ## b
#define RASTERKIT_CAT(a, b) RASTERKIT_DO_CAT(a, b)

#include <boost/assert.hpp>

#define RASTERKIT_ASSERT BOOST_ASSERT
#define ASSERT RASTERKIT_ASSERT

#endif // RASTERKIT_DEFS_HH
