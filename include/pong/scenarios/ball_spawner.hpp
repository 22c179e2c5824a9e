/**
 * @file ball_spawner.hpp
 * @brief Scene-lifecycle timer that serves a new ball
 */

#pragma once

#include <optional>
#include <random>
#include <entt/entt.hpp>

#include "pong/components/basic.hpp"
#include "pong/components/match.hpp"
#include "pong/core/game_config.hpp"

/**
 * @class BallSpawner
 * @brief Serves the ball after a fixed delay whenever none is alive.
 *
 * The timer is armed at scene start and re-armed the first tick it finds the
 * arena empty. When it expires a ball is created at the centre with the
 * configured velocity magnitudes. The first serve goes right and up; later
 * serves go toward the player who conceded the last point, with a random
 * vertical direction.
 */
class BallSpawner {
public:
    explicit BallSpawner(unsigned int seed = std::random_device{}());

    void setGameConfig(const GameConfig& config);

    /** @brief Starts (or restarts) the countdown and forgets previous serves. */
    void reset();

    /** @brief Advances the countdown by this tick's frame time. */
    void update(entt::registry& registry);

    bool isArmed() const { return timer.has_value(); }
    float remainingSeconds() const { return timer.value_or(0.0f); }

    /** @brief Velocity for the next serve given the current scoreboard. */
    Vector serveVelocity(const Components::ScoreBoard& board);

private:
    GameConfig gameConfig;
    std::optional<float> timer;
    std::optional<Components::ScoreBoard> lastServedScore;
    std::mt19937 generator;

    void arm();
    void spawn(entt::registry& registry);
};
