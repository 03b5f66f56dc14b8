#pragma once

// CMake passes SPINDLE_VERSION_* on the compile line from project(VERSION).
// A translation unit built outside CMake reports a development version.

#if !defined(SPINDLE_VERSION_STRING)
#define SPINDLE_VERSION_STRING "0.0.0-dev"
#endif

#define SPINDLE_VERSION_LONG_STRING SPINDLE_VERSION_STRING " (" __DATE__ ")"
