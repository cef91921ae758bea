#include "Rotation.h"

namespace kRotate {

// Pure index remaps: every source pixel lands on exactly one destination
// pixel, so four quarter turns give back the source bit for bit.

Raster rotate90CW(const Raster& src) {
    if (src.empty()) return Raster();
    Raster dst(src.h, src.w);  // swapped
    for (int y = 0; y < src.h; ++y)
        for (int x = 0; x < src.w; ++x)
            dst.at(src.h - 1 - y, x) = src.at(x, y);
    return dst;
}

Raster rotate180(const Raster& src) {
    if (src.empty()) return Raster();
    Raster dst(src.w, src.h);
    for (int y = 0; y < src.h; ++y)
        for (int x = 0; x < src.w; ++x)
            dst.at(src.w - 1 - x, src.h - 1 - y) = src.at(x, y);
    return dst;
}

Raster rotate90CCW(const Raster& src) {
    if (src.empty()) return Raster();
    Raster dst(src.h, src.w);
    for (int y = 0; y < src.h; ++y)
        for (int x = 0; x < src.w; ++x)
            dst.at(y, src.w - 1 - x) = src.at(x, y);
    return dst;
}

bool rotateBy90Increment(const Raster& src, double angle, Raster& out) {
    double n = normalizeAngle(angle);
    if      (n ==   0.0) out = src.empty() ? Raster() : src;
    else if (n ==  90.0) out = rotate90CW(src);
    else if (n == 180.0) out = rotate180(src);
    else if (n == 270.0) out = rotate90CCW(src);
    else return false;
    return true;
}

} // namespace kRotate
