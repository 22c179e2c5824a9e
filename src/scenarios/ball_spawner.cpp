#include "pong/scenarios/ball_spawner.hpp"

#include "pong/core/debug.hpp"
#include "pong/core/match_state.hpp"
#include "pong/core/profile.hpp"
#include "pong/entities/entity_factory.hpp"

BallSpawner::BallSpawner(unsigned int seed)
    : generator(seed)
{}

void BallSpawner::setGameConfig(const GameConfig& config) {
    gameConfig = config;
}

void BallSpawner::reset() {
    lastServedScore.reset();
    arm();
}

void BallSpawner::arm() {
    timer = gameConfig.BallSpawnDelaySeconds;
}

void BallSpawner::update(entt::registry& registry) {
    PROFILE_SCOPE("BallSpawner");

    if (Match::findBall(registry)) {
        return;
    }
    if (!timer) {
        // The ball left the arena since the last tick
        arm();
    }

    *timer -= Match::frameDelta(registry);
    if (*timer <= 0.0f) {
        timer.reset();
        spawn(registry);
    }
}

Vector BallSpawner::serveVelocity(const Components::ScoreBoard& board) {
    float vx = gameConfig.BallVelocityX;
    float vy = gameConfig.BallVelocityY;

    if (lastServedScore) {
        // Serve toward whoever conceded since the previous serve
        if (board.scoreRight > lastServedScore->scoreRight) {
            vx = -vx;
        }
        std::bernoulli_distribution upward(0.5);
        if (!upward(generator)) {
            vy = -vy;
        }
    }
    lastServedScore = board;
    return {vx, vy};
}

void BallSpawner::spawn(entt::registry& registry) {
    Components::ScoreBoard board;
    auto state = Match::findMatchState(registry);
    if (state != entt::null) {
        if (const auto* current = registry.try_get<Components::ScoreBoard>(state)) {
            board = *current;
        }
    }

    Vector const velocity = serveVelocity(board);
    Entities::EntityFactory::createBall(registry, velocity, gameConfig);
    DEBUG_MSG(DEBUG_LEVEL_BASIC,
              "Serving ball with velocity (" << velocity.x << ", " << velocity.y << ")\n");
}
