#define SDL_MAIN_HANDLED
#include "RotateApp.h"

int main(int argc, char** argv) {
    RotateApp app;
    if (!app.parseArgs(argc, argv)) {
        RotateApp::printUsage(argv[0]);
        return 1;
    }
    return app.run();
}
