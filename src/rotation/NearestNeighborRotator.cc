#include "Rotation.h"
#include "Log.h"
#include <cmath>

namespace kRotate {

Raster rotateNearestNeighbor(const Raster& src, double angle) {
    int dstW, dstH;
    getRotatedBounds(src.w, src.h, angle, &dstW, &dstH);
    return rotateNearestNeighbor(src, angle, dstW, dstH);
}

// Inverse mapping: walk the destination, rotate each pixel center back by
// -angle about the canvas centers and take the source pixel it lands in.
// Anything that lands outside the source stays transparent.
Raster rotateNearestNeighbor(const Raster& src, double angle, int dstW, int dstH) {
    if (src.empty() || dstW <= 0 || dstH <= 0) {
        SDL_LogVerbose(KROTATE_LOG_CATEGORY,
                       "rotateNearestNeighbor: degenerate %dx%d -> %dx%d, empty result",
                       src.w, src.h, dstW, dstH);
        return Raster();
    }

    if (normalizeAngle(angle) == 0.0 && dstW == src.w && dstH == src.h)
        return src;

    Raster dst(dstW, dstH);

    const double srcCX = src.w * 0.5, srcCY = src.h * 0.5;
    const double dstCX = dstW  * 0.5, dstCY = dstH  * 0.5;
    const double rad = degreesToRadians(-angle);
    const double c = std::cos(rad), s = std::sin(rad);

    for (int y = 0; y < dstH; ++y) {
        const double dy = y + 0.5 - dstCY;
        uint32_t* row = &dst.pixels[(size_t)y * dstW];
        for (int x = 0; x < dstW; ++x) {
            const double dx = x + 0.5 - dstCX;
            int sx = (int)std::floor(dx * c - dy * s + srcCX);
            int sy = (int)std::floor(dx * s + dy * c + srcCY);
            if (sx >= 0 && sx < src.w && sy >= 0 && sy < src.h)
                row[x] = src.at(sx, sy);
        }
    }
    return dst;
}

} // namespace kRotate
