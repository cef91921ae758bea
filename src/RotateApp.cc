#include "RotateApp.h"
#include "ImageIO.h"
#include "Log.h"
#include <cmath>
#include <cstdlib>
#include <cstring>

using namespace kRotate;

// ─────────────────────────────────────────────────────────────────────────────

RotateApp::RotateApp() {
    SDL_SetMainReady();
    // Only the timer is needed (performance counter); no window, no video.
    if (SDL_Init(SDL_INIT_TIMER) != 0)
        SDL_LogWarn(KROTATE_LOG_CATEGORY, "SDL_Init failed: %s", SDL_GetError());
    else
        sdlReady = true;
    SDL_LogSetPriority(KROTATE_LOG_CATEGORY, SDL_LOG_PRIORITY_INFO);
}

RotateApp::~RotateApp() {
    if (sdlReady) SDL_Quit();
}

// ── Arguments ─────────────────────────────────────────────────────────────────

static bool parseNumber(const char* s, double& out) {
    char* end = nullptr;
    double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool RotateApp::parseArgs(int argc, char** argv) {
    bool haveAngle = false;
    for (int i = 1; i < argc; i++) {
        const char* a = argv[i];
        const char* val = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (!std::strcmp(a, "-c")) { opts.cleanup = true;           continue; }
        if (!std::strcmp(a, "-l")) { opts.exactRightAngles = false; continue; }
        if (!std::strcmp(a, "-v")) { verboseLog = true;             continue; }

        // Everything below takes a value
        if (!val) {
            SDL_LogError(KROTATE_LOG_CATEGORY, "Missing value for %s", a);
            return false;
        }
        ++i;
        if (!std::strcmp(a, "-i")) {
            input = val;
        } else if (!std::strcmp(a, "-o")) {
            output = val;
        } else if (!std::strcmp(a, "-r")) {
            if (!parseNumber(val, angleDeg)) {
                SDL_LogError(KROTATE_LOG_CATEGORY, "Bad angle: %s", val);
                return false;
            }
            haveAngle = true;
        } else if (!std::strcmp(a, "-s")) {
            if (!parseNumber(val, snapDeg) || snapDeg < 0.0) {
                SDL_LogError(KROTATE_LOG_CATEGORY, "Bad snap increment: %s", val);
                return false;
            }
        } else if (!std::strcmp(a, "-q")) {
            if      (!std::strcmp(val, "draft")) opts.quality = Quality::DRAFT;
            else if (!std::strcmp(val, "final")) opts.quality = Quality::FINAL;
            else {
                SDL_LogError(KROTATE_LOG_CATEGORY, "Unknown quality: %s", val);
                return false;
            }
        } else if (!std::strcmp(a, "-p")) {
            if      (!std::strcmp(val, "darker"))  opts.edgePriority = EdgePriority::DARKER;
            else if (!std::strcmp(val, "lighter")) opts.edgePriority = EdgePriority::LIGHTER;
            else {
                SDL_LogError(KROTATE_LOG_CATEGORY, "Unknown edge priority: %s", val);
                return false;
            }
        } else {
            SDL_LogError(KROTATE_LOG_CATEGORY, "Unknown option: %s", a);
            return false;
        }
    }
    return haveAngle && !input.empty() && !output.empty();
}

void RotateApp::printUsage(const char* argv0) {
    SDL_Log("Usage:\n"
            "  %s -i <input> -o <output.png> -r <degrees> [options]\n"
            "    -q draft|final     CleanEdge quality, 2x or 4x (default final)\n"
            "    -p darker|lighter  color that wins at a sliced edge (default darker)\n"
            "    -c                 cleanup pass for smoother slant transitions\n"
            "    -s <degrees>       snap the angle to this increment\n"
            "    -l                 use CleanEdge even for right angles\n"
            "    -v                 debug logging",
            argv0 ? argv0 : "kRotate");
}

// ── Run ───────────────────────────────────────────────────────────────────────

int RotateApp::run() {
    if (verboseLog)
        SDL_LogSetPriority(KROTATE_LOG_CATEGORY, SDL_LOG_PRIORITY_DEBUG);

    Raster src;
    if (!ImageIO::loadImage(input, src))
        return 1;

    double deg = snapDeg > 0.0 ? snapAngle(angleDeg, snapDeg) : angleDeg;

    Uint64 t0 = SDL_GetPerformanceCounter();
    Raster out = rotateCleanEdge(src, deg, opts);
    Uint64 t1 = SDL_GetPerformanceCounter();
    double ms = (double)(t1 - t0) * 1000.0 / (double)SDL_GetPerformanceFrequency();

    if (!ImageIO::savePNG(output, out))
        return 1;

    SDL_LogInfo(KROTATE_LOG_CATEGORY, "%s (%dx%d) rotated %.2f deg -> %s (%dx%d) in %.1f ms",
                input.c_str(), src.w, src.h, normalizeAngle(deg),
                output.c_str(), out.w, out.h, ms);
    return 0;
}
