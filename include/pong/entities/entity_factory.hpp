#pragma once

#include <string>
#include <entt/entt.hpp>

#include "pong/components/basic.hpp"
#include "pong/core/game_config.hpp"

namespace Entities {

/**
 * Factory for the entities a Pong scene is built from.
 */
class EntityFactory {
public:
    /**
     * Creates a paddle at its side's edge, vertically centred.
     *
     * @param registry The entity registry
     * @param side Which edge the paddle defends
     * @param config Arena and paddle dimensions
     * @return The created entity
     */
    static entt::entity createPaddle(
        entt::registry& registry,
        Components::Side side,
        const GameConfig& config
    );

    /**
     * Creates a ball at the centre of the arena.
     *
     * @param registry The entity registry
     * @param velocity Initial velocity in arena units per second
     * @param config Arena dimensions and ball radius
     * @return The created entity
     */
    static entt::entity createBall(
        entt::registry& registry,
        const Vector& velocity,
        const GameConfig& config
    );

    /**
     * Creates an on-screen text label.
     */
    static entt::entity createLabel(
        entt::registry& registry,
        const std::string& text,
        float offsetX,
        float offsetY
    );
};

} // namespace Entities
