#pragma once

#include <SDL2/SDL.h>

// Engine and CLI messages go through SDL's logger under one custom category,
// so a host application can raise or silence them independently:
//   SDL_LogSetPriority(KROTATE_LOG_CATEGORY, SDL_LOG_PRIORITY_DEBUG);
enum { KROTATE_LOG_CATEGORY = SDL_LOG_CATEGORY_CUSTOM };
