#include "version.hpp"

// The version is given by the build system (the 'VERSION' file read in
// 'CMakeLists.txt').

#ifndef VERSION
#error "expected 'VERSION' to be defined by the build system"
#endif

#ifndef COPYRIGHT
#define COPYRIGHT "Copyright (c) 2024 the Dipple authors"
#endif

namespace Dipple {

const char * version () { return VERSION; }

const char * copyright () { return COPYRIGHT; }

const char * signature () { return "dipple-" VERSION; }

}
