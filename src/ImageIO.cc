#include "ImageIO.h"
#include "Log.h"
#include "stb/stb_image.h"
#include "stb/stb_image_write.h"

namespace kRotate {
namespace ImageIO {

// ── Encode / decode ───────────────────────────────────────────────────────────

    std::vector<uint32_t> decodeImage(const uint8_t* data, int dataLen, int& outW, int& outH) {
        if (!data || dataLen <= 0) return {};
        int w, h, channels;
        uint8_t* raw = stbi_load_from_memory(data, dataLen, &w, &h, &channels, 4);
        if (!raw) return {};
        Raster img = Raster::fromRGBA(raw, w, h);
        stbi_image_free(raw);
        outW = w;
        outH = h;
        return img.pixels;
    }

    std::vector<uint8_t> encodePNG(const uint32_t* argbPixels, int w, int h) {
        if (!argbPixels || w <= 0 || h <= 0) return {};
        Raster img(w, h);
        img.pixels.assign(argbPixels, argbPixels + (size_t)w * h);
        auto rgba = img.toRGBA();
        std::vector<uint8_t> out;
        auto cb = [](void* ctx, void* data, int size) {
            auto* buf = static_cast<std::vector<uint8_t>*>(ctx);
            auto* bytes = static_cast<uint8_t*>(data);
            buf->insert(buf->end(), bytes, bytes + size);
        };
        if (!stbi_write_png_to_func(cb, &out, w, h, 4, rgba.data(), w * 4))
            return {};
        return out;
    }

// ── Files ─────────────────────────────────────────────────────────────────────

    bool loadImage(const std::string& path, Raster& out) {
        int w, h, channels;
        uint8_t* raw = stbi_load(path.c_str(), &w, &h, &channels, 4);
        if (!raw) {
            SDL_LogError(KROTATE_LOG_CATEGORY, "Cannot load %s: %s",
                         path.c_str(), stbi_failure_reason());
            return false;
        }
        out = Raster::fromRGBA(raw, w, h);
        stbi_image_free(raw);
        SDL_LogVerbose(KROTATE_LOG_CATEGORY, "Loaded %s (%dx%d, %d channels)",
                       path.c_str(), w, h, channels);
        return true;
    }

    bool savePNG(const std::string& path, const Raster& img) {
        if (img.empty()) {
            SDL_LogError(KROTATE_LOG_CATEGORY, "Cannot save %s: image is empty", path.c_str());
            return false;
        }
        auto rgba = img.toRGBA();
        if (!stbi_write_png(path.c_str(), img.w, img.h, 4, rgba.data(), img.w * 4)) {
            SDL_LogError(KROTATE_LOG_CATEGORY, "Cannot save %s", path.c_str());
            return false;
        }
        return true;
    }

} // namespace ImageIO
} // namespace kRotate
