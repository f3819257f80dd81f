/*
 * Fallback version macros for s3pull. The build may define them on the command line
 * (see CMakeLists.txt); these defaults keep the header usable on its own.
 */

#pragma once

#ifndef S3PULL_VERSION_MAJOR
#define S3PULL_VERSION_MAJOR 0
#endif

#ifndef S3PULL_VERSION_MINOR
#define S3PULL_VERSION_MINOR 0
#endif

#ifndef S3PULL_VERSION_PATCH
#define S3PULL_VERSION_PATCH 0
#endif

#ifndef S3PULL_VERSION_STRING
#define S3PULL_VERSION_STRING "0.0.0+dev"
#endif

#ifndef S3PULL_BUILD_DATE
#define S3PULL_BUILD_DATE __DATE__ " " __TIME__
#endif
