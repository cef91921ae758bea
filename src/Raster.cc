#include "Raster.h"
#include <algorithm>

namespace kRotate {

Raster::Raster(int width, int height, uint32_t fill)
    : w(std::max(0, width)), h(std::max(0, height)),
      pixels((size_t)std::max(0, width) * std::max(0, height), fill) {}

// ── Pixel format conversion ───────────────────────────────────────────────────
// ARGB8888 (0xAARRGGBB) <-> RGBA8888 bytes (R,G,B,A)

std::vector<uint8_t> Raster::toRGBA() const {
    std::vector<uint8_t> rgba(pixels.size() * 4);
    for (size_t i = 0; i < pixels.size(); i++) {
        uint32_t px = pixels[i];
        rgba[i*4+0] = redOf(px);
        rgba[i*4+1] = greenOf(px);
        rgba[i*4+2] = blueOf(px);
        rgba[i*4+3] = alphaOf(px);
    }
    return rgba;
}

Raster Raster::fromRGBA(const uint8_t* rgba, int width, int height) {
    Raster out(width, height);
    if (!rgba) return out;
    for (size_t i = 0; i < out.pixels.size(); i++) {
        const uint8_t* p = rgba + i * 4;
        out.pixels[i] = packARGB(p[0], p[1], p[2], p[3]);
    }
    return out;
}

Mask::Mask(SDL_Rect area, uint8_t fill) : bounds(area) {
    bounds.w = std::max(0, area.w);
    bounds.h = std::max(0, area.h);
    coverage.assign((size_t)bounds.w * bounds.h, fill);
}

int Mask::selectedCount() const {
    return (int)std::count_if(coverage.begin(), coverage.end(),
                              [](uint8_t v) { return v > 127; });
}

} // namespace kRotate
