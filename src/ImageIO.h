#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "Raster.h"

namespace kRotate {

// ── Image files ───────────────────────────────────────────────────────────────
//
// decodeImage: decompress any stb_image-supported format (PNG, JPEG, BMP,
//              TGA, GIF, ...) to ARGB8888. outW/outH are set on success;
//              returns an empty vector on failure.
// encodePNG:   compress ARGB8888 pixels to PNG bytes (alpha preserved).
// loadImage / savePNG: the same through the filesystem; false on failure.
namespace ImageIO {
    std::vector<uint32_t> decodeImage(const uint8_t* data, int dataLen, int& outW, int& outH);
    std::vector<uint8_t>  encodePNG(const uint32_t* argbPixels, int w, int h);

    bool loadImage(const std::string& path, Raster& out);
    bool savePNG(const std::string& path, const Raster& img);
}

} // namespace kRotate
