/**
 * @file bounce.hpp
 * @brief System reflecting the ball off paddles and the top/bottom walls
 *
 * This system handles:
 * - Rectangle (paddle) vs circle (ball) contact via closest-point clamping
 * - Contact with the horizontal walls at y = 0 and y = ArenaHeight
 * - Flipping the sign of one velocity component per contact
 * - Counting applied reflections in MatchEvents for the front end
 *
 * Required components:
 * - Ball + Transform (to read position, modify velocity)
 * - Paddle + Transform (to read)
 */

#ifndef PONG_BOUNCE_SYSTEM_HPP
#define PONG_BOUNCE_SYSTEM_HPP

#include <entt/entt.hpp>
#include "pong/components/basic.hpp"
#include "pong/systems/i_system.hpp"

namespace Systems {

/**
 * @class BounceSystem
 * @brief Velocity-only collision response for the ball
 *
 * A contact only reflects the ball when it is moving into the surface it
 * touches, so a ball that stays overlapping for several ticks is reflected
 * once. Paddle contacts flip vx, wall contacts flip vy; both may happen in the
 * same tick. Positions are never corrected.
 */
class BounceSystem : public ISystem {
public:
    BounceSystem() = default;
    ~BounceSystem() override = default;

    void update(entt::registry &registry) override;
    void setGameConfig(const GameConfig& config) override;

    /**
     * @brief True if a ball with velocity x component @p vx is heading
     *        toward the paddle on @p side.
     */
    static bool movingToward(Components::Side side, float vx);

private:
    GameConfig gameConfig;

    // Both return the number of reflections applied
    unsigned int bounceOffPaddles(entt::registry &registry,
                                  const Components::Transform& ballTransform,
                                  Components::Ball& ball) const;
    unsigned int bounceOffWalls(const Components::Transform& ballTransform,
                                Components::Ball& ball) const;
};

} // namespace Systems

#endif
