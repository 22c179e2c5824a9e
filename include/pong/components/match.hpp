#pragma once

#include <string>
#include <unordered_map>
#include <entt/entt.hpp>

namespace Components {

    // Tag for the single entity that carries match-wide state
    struct MatchState {};

    /// Actual score data. Written only by the winner system.
    struct ScoreBoard {
        int scoreLeft = 0;
        int scoreRight = 0;
    };

    /// Label entities that display the score
    struct ScoreText {
        entt::entity leftScore = entt::null;
        entt::entity rightScore = entt::null;
    };

    /**
     * @brief Running totals of gameplay events since the scene was created
     *
     * Written by the bounce and winner systems; the front end plays a sound
     * whenever a total grows.
     */
    struct MatchEvents {
        unsigned int paddleHits = 0;
        unsigned int wallHits = 0;
        unsigned int points = 0;
    };

    struct FrameTime {
        float deltaSeconds = 0.0f;
    };

    /**
     * @brief Per-tick input axis values keyed by action name
     *
     * 1.0 moves a paddle toward the top of the arena, -1.0 toward the bottom.
     */
    struct InputAxes {
        std::unordered_map<std::string, float> values;
    };

} // namespace Components
