#ifndef PONG_PONG_SCENARIO_HPP
#define PONG_PONG_SCENARIO_HPP

#include "pong/scenarios/i_scenario.hpp"
#include <entt/entt.hpp>

/**
 * @class PongScenario
 *
 * Two paddles at the left and right edges, a 0:0 scoreboard and its two
 * labels. The ball is not part of the initial scene; BallSpawner serves it.
 */
class PongScenario : public IScenario {
public:
    PongScenario() = default;
    explicit PongScenario(const GameConfig& config) : config(config) {}
    ~PongScenario() override = default;

    GameConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

private:
    GameConfig config;
};

#endif // PONG_PONG_SCENARIO_HPP
