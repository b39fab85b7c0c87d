// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RASTERKIT_UTILS_PARSEARGS_HH
#define RASTERKIT_UTILS_PARSEARGS_HH

#include <defs.hh>

namespace rasterkit {

//
// Argument kinds:
//
enum arg_kind_t {
    argFlag,   // flag (present / not-present)
               //   [val: bool*]
    argInt,    // integer arg
               //   [val: int*]
    argFP,     // floating point arg
               //   [val: double*]
    argString, // string arg
               //   [val: std::string*]
    //
    // Dummy entries -- these show up in the usage listing only:
    //
    argFlagDummy,
    argIntDummy,
    argFPDummy,
    argStringDummy
};

//
// Argument descriptor; a table of these ends with an entry whose <arg> is
// null:
//
struct arg_desc_t {
    const char* arg;   // the command line switch
    arg_kind_t kind;   // kind of arg
    void* val;         // place to store value
    const char* usage; // usage string
};

//
// Parse command line. Removes all args which are found in the arg
// descriptor list <args>. Stops parsing if "--" is found (and removes
// it). Returns false if there was an error, which is reported.
//
bool parse_args (const arg_desc_t* args, int* argc, char* argv []);

//
// Print usage message, based on arg descriptor list:
//
void print_usage (
    const char* program, const char* other_args, const arg_desc_t* args);

} // namespace rasterkit

#endif // RASTERKIT_UTILS_PARSEARGS_HH
