#pragma once

/**
 * @file netpbm.hpp
 * @brief Minimal binary PPM (P6) / PAM (P7) reader and writer.
 *
 * Enough of an image codec for the command-line tool and the examples.
 * Decoded images are always RGBA8888; PPM input gets opaque alpha.
 */

#include "scrub/pixmap.hpp"
#include <string>

namespace scrub {

/// @brief Decode a binary PPM or PAM file.
/// @param path File to read.
/// @return An RGBA Pixmap, or an invalid Pixmap when the file cannot be read
///         or is not a supported Netpbm variant (the reason is logged).
Pixmap decodeNetpbm(const std::string& path);

/// @brief Write a binary PPM (P6). Alpha is dropped.
/// @return False on I/O failure or an invalid pixmap.
bool encodePpm(const Pixmap& pixmap, const std::string& path);

/// @brief Write a PAM (P7) with TUPLTYPE RGB_ALPHA.
/// @return False on I/O failure or an invalid pixmap.
bool encodePam(const Pixmap& pixmap, const std::string& path);

/// @brief Write PAM when @p path ends in ".pam", PPM otherwise.
bool encodeNetpbm(const Pixmap& pixmap, const std::string& path);

} // namespace scrub
