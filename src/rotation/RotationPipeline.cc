#include "Rotation.h"
#include "Log.h"
#include <algorithm>

namespace kRotate {

int qualityScale(Quality q) {
    return q == Quality::DRAFT ? 2 : 4;
}

// ceil(scale * x) never exceeds scale * ceil(x), but float noise in the trig
// terms can; anything past the canvas edge is dropped.
static void blitTopLeft(const Raster& src, Raster& dst) {
    const int w = std::min(src.w, dst.w);
    const int h = std::min(src.h, dst.h);
    for (int y = 0; y < h; ++y)
        std::copy_n(&src.pixels[(size_t)y * src.w], w, &dst.pixels[(size_t)y * dst.w]);
}

// ── rotateCleanEdge ───────────────────────────────────────────────────────────
//
// Upscale with CleanEdge so diagonals are already drawn at sub-pixel
// resolution, rotate that with nearest-neighbor, then average back down.
// The upscaled rotation keeps its own tight bounds and is pasted at the
// top-left of a canvas of scale x the analytic bounds of the source, so its
// edges line up with the downscale blocks: only the right and bottom block
// rows can be partially covered, never both sides of the shape.

Raster rotateCleanEdge(const Raster& src, double angle, const RotationOptions& opts) {
    if (src.empty()) return Raster();

    const double normalized = normalizeAngle(angle);
    if (normalized == 0.0)
        return src;

    Raster exact;
    if (opts.exactRightAngles && rotateBy90Increment(src, normalized, exact)) {
        SDL_LogDebug(KROTATE_LOG_CATEGORY, "rotate %dx%d by %.1f: exact remap",
                     src.w, src.h, normalized);
        return exact;
    }

    const int scale = qualityScale(opts.quality);
    int outW, outH;
    getRotatedBounds(src.w, src.h, normalized, &outW, &outH);

    SDL_LogDebug(KROTATE_LOG_CATEGORY, "rotate %dx%d by %.3f: CleanEdge x%d -> %dx%d",
                 src.w, src.h, normalized, scale, outW, outH);

    Raster upscaled = applyCleanEdge(src, scale, opts.cleanEdge());
    Raster rotated  = rotateNearestNeighbor(upscaled, normalized);
    Raster canvas(outW * scale, outH * scale);
    blitTopLeft(rotated, canvas);
    return downscaleAreaAverage(canvas, scale);
}

// ── rotateSelection ───────────────────────────────────────────────────────────

RotationResult rotateSelection(const RotationRequest& req) {
    RotationResult res;
    const double normalized = normalizeAngle(req.angle);

    res.raster = rotateCleanEdge(req.raster, normalized, req.options);

    SDL_Rect srcBounds = req.bounds;
    if (srcBounds.w <= 0 || srcBounds.h <= 0)
        srcBounds = { 0, 0, req.raster.w, req.raster.h };
    res.bounds = calculateRotatedBounds(srcBounds, normalized);
    // The preview is drawn at bounds, so its size must be the raster's
    res.bounds.w = res.raster.w;
    res.bounds.h = res.raster.h;

    // Pixel-center sampling keeps right-angle mask turns exact as well
    if (!req.mask.empty())
        res.mask = rotateMask(req.mask, normalized);
    return res;
}

} // namespace kRotate
