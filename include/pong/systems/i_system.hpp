/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the Pong simulation
 */

#pragma once

#include <entt/entt.hpp>
#include "pong/core/game_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * A system reads and writes its own component types in the registry once per
 * tick. Frame time and input are read from the match-state entity.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the arena and gameplay constants
     *
     * @param config Game configuration parameters
     */
    virtual void setGameConfig(const GameConfig& config) = 0;
};

} // namespace Systems
