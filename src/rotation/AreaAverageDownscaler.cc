#include "Rotation.h"
#include "Log.h"

namespace kRotate {

// Only opaque sub-pixels feed the RGB mean, so transparent padding around a
// rotated shape never darkens its edge. Alpha is hard: a block is opaque when
// at least half of it was covered.
Raster downscaleAreaAverage(const Raster& src, int factor) {
    if (factor < 1) {
        SDL_LogWarn(KROTATE_LOG_CATEGORY, "downscaleAreaAverage: factor %d clamped to 1", factor);
        factor = 1;
    }
    const int outW = src.w / factor, outH = src.h / factor;
    if (src.empty() || outW <= 0 || outH <= 0) return Raster();

    Raster dst(outW, outH);
    const int blockArea = factor * factor;

    for (int y = 0; y < outH; ++y) {
        for (int x = 0; x < outW; ++x) {
            unsigned r = 0, g = 0, b = 0;
            int opaque = 0;
            for (int sy = 0; sy < factor; ++sy) {
                const uint32_t* row = &src.pixels[(size_t)(y * factor + sy) * src.w + x * factor];
                for (int sx = 0; sx < factor; ++sx) {
                    uint32_t px = row[sx];
                    if (alphaOf(px) == 0) continue;
                    r += redOf(px);
                    g += greenOf(px);
                    b += blueOf(px);
                    ++opaque;
                }
            }
            if (opaque == 0) continue;  // stays transparent zero
            const unsigned half = opaque / 2;
            dst.at(x, y) = packARGB((uint8_t)((r + half) / opaque),
                                    (uint8_t)((g + half) / opaque),
                                    (uint8_t)((b + half) / opaque),
                                    2 * opaque >= blockArea ? 255 : 0);
        }
    }
    return dst;
}

} // namespace kRotate
