#include "Rotation.h"
#include "EdgeClassifier.h"
#include "Log.h"

namespace kRotate {

CleanEdgeOptions RotationOptions::cleanEdge() const {
    CleanEdgeOptions o;
    o.cleanup      = cleanup;
    o.edgePriority = edgePriority;
    o.lineWidth    = lineWidth;
    return o;
}

// Each source pixel becomes a scale x scale block. Every sample in the block
// is classified on its own: its quadrant picks the point direction, and the
// classifier decides whether a neighboring color cuts across it.
Raster applyCleanEdge(const Raster& src, int scale, const CleanEdgeOptions& opts) {
    if (src.empty()) return Raster();
    if (scale < 1) {
        SDL_LogWarn(KROTATE_LOG_CATEGORY, "applyCleanEdge: scale %d clamped to 1", scale);
        scale = 1;
    }

    Raster dst(src.w * scale, src.h * scale);
    EdgeClassifier::Neighborhood hood;

    for (int dstY = 0; dstY < dst.h; ++dstY) {
        const int   srcY   = dstY / scale;
        const float localY = ((dstY % scale) + 0.5f) / scale;
        const int   pdy    = localY < 0.5f ? -1 : 1;
        uint32_t* row = &dst.pixels[(size_t)dstY * dst.w];

        for (int dstX = 0; dstX < dst.w; ++dstX) {
            const int   srcX   = dstX / scale;
            const float localX = ((dstX % scale) + 0.5f) / scale;
            const int   pdx    = localX < 0.5f ? -1 : 1;

            hood.gather(src, srcX, srcY, pdx, pdy);
            row[dstX] = EdgeClassifier::classify(hood, { localX, localY }, opts);
        }
    }
    return dst;
}

} // namespace kRotate
