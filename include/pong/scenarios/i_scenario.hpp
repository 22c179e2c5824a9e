#ifndef PONG_I_SCENARIO_HPP
#define PONG_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "pong/core/game_config.hpp"

/**
 * @brief Abstract base class for a playable scene
 *
 * Each scenario must provide:
 *  - getConfig() returning the GameConfig its systems run with
 *  - createEntities() that spawns the scene's starting entities
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns arena and gameplay constants for this scene
     */
    virtual GameConfig getConfig() const = 0;

    /**
     * @brief Creates scene entities in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;
};

#endif // PONG_I_SCENARIO_HPP
