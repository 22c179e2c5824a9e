#pragma once

/**
 * @struct GameConfig
 * @brief Arena and gameplay constants shared by every system.
 *
 * Values are fixed for the lifetime of a match. All lengths are arena units,
 * speeds are arena units per second.
 */
struct GameConfig {
    float ArenaWidth = 100.0f;
    float ArenaHeight = 100.0f;

    float PaddleWidth = 4.0f;
    float PaddleHeight = 16.0f;
    float PaddleSpeed = 72.0f;

    float BallVelocityX = 75.0f;
    float BallVelocityY = 50.0f;
    float BallRadius = 2.0f;

    // Delay between the ball leaving the arena (or scene start) and the next serve
    float BallSpawnDelaySeconds = 2.0f;

    float SecondsPerTick = 1.0f / 60.0f;
};
