/**
 * @fileoverview sound_board.hpp
 * @brief Plays the bounce and score sounds as match events happen.
 */

#pragma once

#include <entt/entt.hpp>
#include <SFML/Audio.hpp>

#include "pong/components/match.hpp"

/**
 * @class SoundBoard
 * @brief Watches MatchEvents on the match state and plays one sound per new event.
 */
class SoundBoard {
public:
    SoundBoard() = default;
    ~SoundBoard() = default;

    SoundBoard(const SoundBoard&) = delete;
    SoundBoard& operator=(const SoundBoard&) = delete;

    /**
     * @brief Synthesizes the sound effects
     * @return false if a sound buffer could not be created
     */
    bool init();

    /**
     * @brief Plays sounds for events recorded since the last call
     *
     * Totals that went down mean the scene was reset; they are taken as the
     * new baseline without playing anything.
     */
    void update(const entt::registry& registry);

private:
    struct Effect {
        sf::SoundBuffer buffer;
        sf::Sound sound;
    };

    Effect paddleHit;
    Effect wallHit;
    Effect point;
    Components::MatchEvents lastSeen;
    bool ready = false;

    static bool synthesize(Effect& effect, float frequency, float seconds);
};
