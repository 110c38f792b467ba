#pragma once

// Define version components
#define HUDDLE_VERSION_MAJOR 0
#define HUDDLE_VERSION_MINOR 2
#define HUDDLE_VERSION_PATCH 0

// Helper macros for string conversion
#define HUDDLE_STRINGIFY(x) #x
#define HUDDLE_TOSTRING(x) HUDDLE_STRINGIFY(x)

// Version as string in format "MAJOR.MINOR.PATCH"
#define HUDDLE_VERSION_STRING HUDDLE_TOSTRING(HUDDLE_VERSION_MAJOR) "." HUDDLE_TOSTRING(HUDDLE_VERSION_MINOR) "." HUDDLE_TOSTRING(HUDDLE_VERSION_PATCH)

// Version as numeric value (10000*MAJOR + 100*MINOR + PATCH)
#define HUDDLE_VERSION_NUM ((HUDDLE_VERSION_MAJOR * 10000) + (HUDDLE_VERSION_MINOR * 100) + HUDDLE_VERSION_PATCH)
