#pragma once

#include <cstdint>

// Grayscale brightness of an escape time: floor(255 * n / max_iter).
// Interior points (n == max_iter) come out white.
inline uint8_t escape_brightness(uint32_t n, uint32_t max_iter)
{
    return static_cast<uint8_t>((255ull * n) / max_iter);
}

// Opaque gray pixel (v, v, v) packed as 0xAABBGGRR.
inline uint32_t gray_color(uint8_t v)
{
    return 0xFF000000u
         | (static_cast<uint32_t>(v) << 16)
         | (static_cast<uint32_t>(v) <<  8)
         |  static_cast<uint32_t>(v);
}

inline uint8_t pixel_red(uint32_t p)   { return static_cast<uint8_t>(p);       }
inline uint8_t pixel_green(uint32_t p) { return static_cast<uint8_t>(p >> 8);  }
inline uint8_t pixel_blue(uint32_t p)  { return static_cast<uint8_t>(p >> 16); }
