#include "pong/systems/paddle.hpp"

#include "pong/core/constants.hpp"
#include "pong/core/match_state.hpp"
#include "pong/core/profile.hpp"

namespace Systems {

const std::string& PaddleSystem::actionFor(Components::Side side) {
    return side == Components::Side::Left ? PongConstants::LeftPaddleAction
                                          : PongConstants::RightPaddleAction;
}

void PaddleSystem::setGameConfig(const GameConfig& config) {
    gameConfig = config;
}

void PaddleSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("PaddleSystem");

    float const dt = Match::frameDelta(registry);

    auto view = registry.view<const Components::Paddle, Components::Transform>();
    for (auto &&[entity, paddle, transform] : view.each()) {
        float const axis = Match::inputAxis(registry, actionFor(paddle.side));
        float const halfHeight = paddle.height * 0.5f;

        float const candidate = transform.y + axis * dt * gameConfig.PaddleSpeed;
        transform.y = clampf(candidate, halfHeight, gameConfig.ArenaHeight - halfHeight);
    }
}

} // namespace Systems
