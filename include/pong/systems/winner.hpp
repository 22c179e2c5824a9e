/**
 * @file winner.hpp
 * @brief System ending a round when the ball leaves through a vertical edge
 *
 * Required components:
 * - Ball + Transform (to read)
 * - ScoreBoard, ScoreText, MatchEvents on the match state (to modify)
 * - UiText on the score labels (to modify)
 */

#ifndef PONG_WINNER_SYSTEM_HPP
#define PONG_WINNER_SYSTEM_HPP

#include <optional>
#include <entt/entt.hpp>
#include "pong/components/basic.hpp"
#include "pong/systems/i_system.hpp"

namespace Systems {

/**
 * @class WinnerSystem
 * @brief Scores a point and removes the ball once it is fully off the arena
 *
 * Leaving past x < -radius is a point for the right player, past
 * x > ArenaWidth + radius a point for the left player. The ball entity is
 * destroyed and the scoring side's label text is updated. Respawning belongs
 * to the scene lifecycle; this system never creates a ball.
 */
class WinnerSystem : public ISystem {
public:
    WinnerSystem() = default;
    ~WinnerSystem() override = default;

    void update(entt::registry &registry) override;
    void setGameConfig(const GameConfig& config) override;

    /**
     * @brief Side that scores when a ball of @p radius is at @p x, if any.
     */
    std::optional<Components::Side> scoringSide(float x, float radius) const;

private:
    GameConfig gameConfig;

    static void awardPoint(entt::registry &registry, Components::Side scorer);
};

} // namespace Systems

#endif
