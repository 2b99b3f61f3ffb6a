#pragma once

/**
 * @file cli_args.hpp
 * @brief Strict parsers for scrub_cli option values.
 *
 * Each parser accepts the whole string or nothing; on failure @p out is left
 * unchanged and false is returned.
 */

#include <scrub/selection.hpp>
#include <scrub/types.hpp>

namespace scrub {
namespace cli {

/// @brief Parse a base-10 integer that fits in i32.
bool parseInt(const char* s, i32& out);

/// @brief Parse a non-negative base-10 integer that fits in u32.
bool parseSeed(const char* s, u32& out);

/// @brief Parse a finite float.
bool parseFloat(const char* s, f32& out);

/// @brief Parse "x,y,w,h" into a rectangle; each field goes through parseInt.
bool parseRect(const char* s, Selection& out);

} // namespace cli
} // namespace scrub
