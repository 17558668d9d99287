#pragma once

#define TASKRELAY_VERSION_MAJOR 0
#define TASKRELAY_VERSION_MINOR 1
#define TASKRELAY_VERSION_PATCH 0

#define TASKRELAY_STRINGIFY(x) #x
#define TASKRELAY_TOSTRING(x) TASKRELAY_STRINGIFY(x)

// "MAJOR.MINOR.PATCH"
#define TASKRELAY_VERSION_STRING \
    TASKRELAY_TOSTRING(TASKRELAY_VERSION_MAJOR) "." \
    TASKRELAY_TOSTRING(TASKRELAY_VERSION_MINOR) "." \
    TASKRELAY_TOSTRING(TASKRELAY_VERSION_PATCH)
