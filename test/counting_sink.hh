// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RASTERKIT_TEST_COUNTING_SINK_HH
#define RASTERKIT_TEST_COUNTING_SINK_HH

#include <defs.hh>

#include <rasterkit/bitmap.hh>
#include <rasterkit/sink.hh>

//
// A bitmap that counts every call made through the sink interface:
//
struct counting_sink_t : rasterkit::sink_t {
    counting_sink_t (int width, int height) : bitmap (width, height) { }

    int width  () const override { return bitmap.width ();  }
    int height () const override { return bitmap.height (); }

    void set_pixel (int x, int y, const rasterkit::color_t& c) override {
        ++sets;
        bitmap.set_pixel (x, y, c);
    }

    rasterkit::color_t get_pixel (int x, int y) const override {
        ++gets;
        return bitmap.get_pixel (x, y);
    }

    rasterkit::bitmap_t bitmap;
    mutable size_t gets = 0;
    size_t sets = 0;
};

#endif // RASTERKIT_TEST_COUNTING_SINK_HH
