/**
 * @file movement.hpp
 * @brief System for integrating the ball's velocity into its transform
 *
 * Required components:
 * - Ball (to read velocity)
 * - Transform (to modify)
 */

#ifndef PONG_MOVEMENT_SYSTEM_HPP
#define PONG_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "pong/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Moves the ball by velocity * dt
 *
 * No clamping: leaving the arena is the winner system's concern.
 * Does nothing while no ball is alive.
 */
class BallMovementSystem : public ISystem {
public:
    BallMovementSystem() = default;
    ~BallMovementSystem() override = default;

    void update(entt::registry &registry) override;
    void setGameConfig(const GameConfig& config) override;

private:
    GameConfig gameConfig;
};

} // namespace Systems

#endif
