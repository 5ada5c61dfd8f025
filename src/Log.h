#pragma once

#include <SDL3/SDL.h>

namespace Tessera {

// SDL log category for everything the painter reports
enum {
    TESSERA_LOG_CATEGORY = SDL_LOG_CATEGORY_CUSTOM
};

namespace Log {

/**
 * Enable or silence debug output for the painter's category.
 * Errors and warnings are always emitted.
 */
inline void SetVerbose(bool verbose) {
    SDL_SetLogPriority(
        TESSERA_LOG_CATEGORY,
        verbose ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_WARN
    );
}

}  // namespace Log
}  // namespace Tessera
