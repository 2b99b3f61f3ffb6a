#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases and the color type for the scrub library.
 */

namespace scrub {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u16 = uint16_t;  ///< Unsigned 16-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief An RGBA color with 8-bit components.
struct Color {
    u8 r = 0;    ///< Red component (0–255).
    u8 g = 0;    ///< Green component (0–255).
    u8 b = 0;    ///< Blue component (0–255).
    u8 a = 255;  ///< Alpha component (0–255), default opaque.

    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

}
