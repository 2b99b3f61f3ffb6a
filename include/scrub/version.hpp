#pragma once

/// @file version.hpp
/// @brief Library version information.

#define SCRUB_VERSION_MAJOR 0
#define SCRUB_VERSION_MINOR 3
#define SCRUB_VERSION_PATCH 0

namespace scrub {

/// @brief Return the library version string (e.g. "0.3.0").
/// @return Null-terminated version string in "major.minor.patch" format.
inline const char* version() {
    return "0.3.0";
}

/// @brief Return the major version number.
inline int versionMajor() { return SCRUB_VERSION_MAJOR; }
/// @brief Return the minor version number.
inline int versionMinor() { return SCRUB_VERSION_MINOR; }
/// @brief Return the patch version number.
inline int versionPatch() { return SCRUB_VERSION_PATCH; }

} // namespace scrub
