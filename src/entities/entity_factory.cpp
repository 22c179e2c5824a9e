#include "pong/entities/entity_factory.hpp"

namespace Entities {

entt::entity EntityFactory::createPaddle(entt::registry& registry,
                                         Components::Side side,
                                         const GameConfig& config) {
    float const x = side == Components::Side::Left
        ? config.PaddleWidth * 0.5f
        : config.ArenaWidth - config.PaddleWidth * 0.5f;
    float const y = config.ArenaHeight * 0.5f;

    auto entity = registry.create();
    registry.emplace<Components::Paddle>(entity, side, config.PaddleWidth, config.PaddleHeight);
    registry.emplace<Components::Transform>(entity, x, y, 0.0f);
    return entity;
}

entt::entity EntityFactory::createBall(entt::registry& registry,
                                       const Vector& velocity,
                                       const GameConfig& config) {
    auto entity = registry.create();
    registry.emplace<Components::Ball>(entity, velocity, config.BallRadius);
    registry.emplace<Components::Transform>(entity,
                                            config.ArenaWidth * 0.5f,
                                            config.ArenaHeight * 0.5f,
                                            0.0f);
    return entity;
}

entt::entity EntityFactory::createLabel(entt::registry& registry,
                                        const std::string& text,
                                        float offsetX,
                                        float offsetY) {
    auto entity = registry.create();
    auto& label = registry.emplace<Components::UiText>(entity);
    label.text = text;
    label.offsetX = offsetX;
    label.offsetY = offsetY;
    return entity;
}

} // namespace Entities
