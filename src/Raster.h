#pragma once

#include <SDL2/SDL.h>
#include <vector>
#include <cstdint>

namespace kRotate {

// ── Packed pixels ─────────────────────────────────────────────────────────────
//
// ARGB8888 (0xAARRGGBB), the same layout the canvas textures use. Comparing
// and measuring colors on one uint32_t avoids per-pixel objects in the hot
// loops of the CleanEdge pass.

const uint32_t TRANSPARENT_PX = 0x00000000;

inline uint32_t packARGB(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return ((uint32_t)a << 24) | ((uint32_t)r << 16) | ((uint32_t)g << 8) | (uint32_t)b;
}
inline uint8_t alphaOf(uint32_t px) { return (px >> 24) & 0xFF; }
inline uint8_t redOf  (uint32_t px) { return (px >> 16) & 0xFF; }
inline uint8_t greenOf(uint32_t px) { return (px >>  8) & 0xFF; }
inline uint8_t blueOf (uint32_t px) { return  px        & 0xFF; }

// ── Raster ────────────────────────────────────────────────────────────────────
//
// Row-major, top-left origin, y-down. A raster with zero area is "empty";
// every rotation maps an empty raster to an empty (0x0) result.

struct Raster {
    int w = 0, h = 0;
    std::vector<uint32_t> pixels;

    Raster() {}
    Raster(int width, int height, uint32_t fill = TRANSPARENT_PX);

    bool empty() const { return w <= 0 || h <= 0; }

    uint32_t  at(int x, int y) const { return pixels[(size_t)y * w + x]; }
    uint32_t& at(int x, int y)       { return pixels[(size_t)y * w + x]; }

    // Bounds-checked read; anything outside the raster is transparent.
    uint32_t sample(int x, int y) const {
        if (x < 0 || x >= w || y < 0 || y >= h) return TRANSPARENT_PX;
        return pixels[(size_t)y * w + x];
    }

    // Plain RGBA8 byte buffer (bytes R,G,B,A per pixel) for stb and callers
    // that hold raw image data.
    std::vector<uint8_t> toRGBA() const;
    static Raster fromRGBA(const uint8_t* rgba, int width, int height);

    bool operator==(const Raster& o) const { return w == o.w && h == o.h && pixels == o.pixels; }
    bool operator!=(const Raster& o) const { return !(*this == o); }
};

// ── Mask ──────────────────────────────────────────────────────────────────────
//
// Freeform selection membership: bounds.w * bounds.h coverage bytes, each 0
// (outside) or 255 (selected), positioned in canvas space by bounds.

struct Mask {
    SDL_Rect bounds = {0, 0, 0, 0};
    std::vector<uint8_t> coverage;

    Mask() {}
    Mask(SDL_Rect area, uint8_t fill = 0);

    bool empty() const { return bounds.w <= 0 || bounds.h <= 0 || coverage.empty(); }
    uint8_t  at(int x, int y) const { return coverage[(size_t)y * bounds.w + x]; }
    uint8_t& at(int x, int y)       { return coverage[(size_t)y * bounds.w + x]; }
    int selectedCount() const;
};

} // namespace kRotate
