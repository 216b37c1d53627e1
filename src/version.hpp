#pragma once

// Build/version info.
//
// CMake defines BACKDROP_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef BACKDROP_VERSION
#define BACKDROP_VERSION "dev"
#endif

#ifndef BACKDROP_APPNAME
#define BACKDROP_APPNAME "Backdrop"
#endif
