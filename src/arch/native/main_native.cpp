/**
 * @file main_native.cpp
 * @brief Main entry point for the native platform.
 *
 * Initializes the GameManager singleton and runs the main loop.
 */

#include "pong/core/game_manager.hpp"
#include "pong/core/profile.hpp"

int main() {
    GameManager& game = GameManager::getInstance();
    if (!game.init()) {
        return 1;
    }

    {
        PROFILE_SCOPE("main");
        game.run();
    }

    Profiling::Profiler::printStats();
    return 0;
}
