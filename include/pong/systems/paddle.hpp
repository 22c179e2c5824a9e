/**
 * @file paddle.hpp
 * @brief System moving paddles from per-side input axes
 *
 * Required components:
 * - Paddle (to read side and height)
 * - Transform (to modify y)
 *
 * Reads the frame time and the "left_paddle"/"right_paddle" axes from the
 * match state. A missing axis counts as 0.
 */

#ifndef PONG_PADDLE_SYSTEM_HPP
#define PONG_PADDLE_SYSTEM_HPP

#include <string>
#include <entt/entt.hpp>
#include "pong/components/basic.hpp"
#include "pong/systems/i_system.hpp"

namespace Systems {

/**
 * @class PaddleSystem
 * @brief Moves each paddle vertically and keeps it inside the arena
 *
 * y' = clamp(y + axis * dt * PaddleSpeed, height/2, ArenaHeight - height/2).
 * x is never touched.
 */
class PaddleSystem : public ISystem {
public:
    PaddleSystem() = default;
    ~PaddleSystem() override = default;

    void update(entt::registry &registry) override;
    void setGameConfig(const GameConfig& config) override;

    /** @brief Input action controlling the paddle on @p side */
    static const std::string& actionFor(Components::Side side);

private:
    GameConfig gameConfig;
};

} // namespace Systems

#endif
