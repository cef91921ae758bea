#include "Rotation.h"

namespace kRotate {

Mask rotateMask(const Mask& mask, double angle) {
    if (normalizeAngle(angle) == 0.0)
        return mask;

    // Coverage rides in the alpha channel of an otherwise black raster
    Raster carrier(mask.bounds.w, mask.bounds.h);
    for (size_t i = 0; i < carrier.pixels.size() && i < mask.coverage.size(); ++i)
        carrier.pixels[i] = (uint32_t)mask.coverage[i] << 24;

    Raster rotated = rotateNearestNeighbor(carrier, angle);

    Mask out;
    out.bounds   = calculateRotatedBounds(mask.bounds, angle);
    // Trust the pixel buffer over the analytic size
    out.bounds.w = rotated.w;
    out.bounds.h = rotated.h;
    out.coverage.resize(rotated.pixels.size());
    for (size_t i = 0; i < rotated.pixels.size(); ++i)
        out.coverage[i] = alphaOf(rotated.pixels[i]) > 127 ? 255 : 0;
    return out;
}

} // namespace kRotate
