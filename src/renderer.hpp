#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    uint32_t width  = 0;
    uint32_t height = 0;

    void resize(uint32_t w, uint32_t h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * h, 0xFF000000u);
    }

    uint32_t at(uint32_t x, uint32_t y) const
    {
        return pixels[static_cast<size_t>(y) * width + x];
    }

    // Solid fill of [x, x+w) x [y, y+h), clipped to the buffer.
    void fill_rect(uint32_t x, uint32_t y, uint32_t w, uint32_t h, uint32_t color)
    {
        if (x >= width || y >= height) return;
        const uint32_t x1 = (w > width  - x) ? width  : x + w;
        const uint32_t y1 = (h > height - y) ? height : y + h;
        for (uint32_t py = y; py < y1; ++py) {
            uint32_t* row = pixels.data() + static_cast<size_t>(py) * width;
            for (uint32_t px = x; px < x1; ++px)
                row[px] = color;
        }
    }
};
