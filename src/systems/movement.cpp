#include "pong/systems/movement.hpp"

#include "pong/components/basic.hpp"
#include "pong/core/match_state.hpp"
#include "pong/core/profile.hpp"

namespace Systems {

void BallMovementSystem::setGameConfig(const GameConfig& config) {
    gameConfig = config;
}

void BallMovementSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BallMovementSystem");

    auto ball = Match::findBall(registry);
    if (!ball) {
        return;
    }

    float const dt = Match::frameDelta(registry);
    const auto& body = registry.get<Components::Ball>(*ball);
    auto& transform = registry.get<Components::Transform>(*ball);

    transform.x += body.velocity.x * dt;
    transform.y += body.velocity.y * dt;
}

} // namespace Systems
