#pragma once

#include <SDL2/SDL.h>
#include <string>
#include "Rotation.h"

// Command-line front end: load an image, rotate it with the selection
// engine, write a PNG.
//
//   kRotate -i <input> -o <output.png> -r <degrees>
//           [-q draft|final] [-p darker|lighter] [-c] [-s <snap>] [-l] [-v]
class RotateApp {
  public:
    RotateApp();
    ~RotateApp();

    // Returns false on a missing or malformed argument; the caller prints usage.
    bool parseArgs(int argc, char** argv);
    static void printUsage(const char* argv0);

    // Process exit code: 0 on success, 1 on load/save failure.
    int run();

    const std::string&             inputPath()  const { return input; }
    const std::string&             outputPath() const { return output; }
    double                         angle()      const { return angleDeg; }
    double                         snap()       const { return snapDeg; }
    bool                           verbose()    const { return verboseLog; }
    const kRotate::RotationOptions& options()   const { return opts; }

  private:
    std::string input;
    std::string output;
    double      angleDeg   = 0.0;
    double      snapDeg    = 0.0;  // 0 = no snapping
    bool        verboseLog = false;
    bool        sdlReady   = false;
    kRotate::RotationOptions opts;
};
