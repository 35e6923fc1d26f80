#pragma once

// ==============================================================================
// Version Information
// ==============================================================================
// Keep in sync with CMakeLists.txt project version.
// ==============================================================================

#define NOTESCOPE_MAJOR_VERSION_STR "0"
#define NOTESCOPE_MAJOR_VERSION_INT 0

#define NOTESCOPE_SUB_VERSION_STR "3"
#define NOTESCOPE_SUB_VERSION_INT 3

#define NOTESCOPE_RELEASE_NUMBER_STR "0"
#define NOTESCOPE_RELEASE_NUMBER_INT 0

#define NOTESCOPE_VERSION_STR \
    NOTESCOPE_MAJOR_VERSION_STR "." NOTESCOPE_SUB_VERSION_STR "." NOTESCOPE_RELEASE_NUMBER_STR

#define NOTESCOPE_PROGRAM_NAME "notescope"
#define NOTESCOPE_DESCRIPTION "Real-time spectrum and peak analyzer for live audio input"
