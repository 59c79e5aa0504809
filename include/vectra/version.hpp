/*
 * Fallback version header for vectra
 *
 * The build defines VECTRA_VERSION_* from project(); these defaults keep
 * standalone consumers of the headers compiling.
 */

#pragma once

#ifndef VECTRA_VERSION_MAJOR
#define VECTRA_VERSION_MAJOR 0
#endif

#ifndef VECTRA_VERSION_MINOR
#define VECTRA_VERSION_MINOR 0
#endif

#ifndef VECTRA_VERSION_PATCH
#define VECTRA_VERSION_PATCH 0
#endif

#ifndef VECTRA_VERSION_STRING
#define VECTRA_VERSION_STRING "0.0.0+dev"
#endif
