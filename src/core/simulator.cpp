/**
 * @file simulator.cpp
 * @brief Implementation of PongSimulator.
 */

#include "pong/core/simulator.hpp"

#include <stdexcept>
#include <utility>

#include "pong/core/debug.hpp"
#include "pong/core/match_state.hpp"
#include "pong/core/profile.hpp"
#include "pong/systems/bounce.hpp"
#include "pong/systems/movement.hpp"
#include "pong/systems/paddle.hpp"
#include "pong/systems/winner.hpp"

PongSimulator::PongSimulator(std::unique_ptr<IScenario> scenario, unsigned int seed)
    : spawner(seed)
{
  createSystems();
  loadScenario(std::move(scenario));
}

PongSimulator::~PongSimulator() = default;

void PongSimulator::createSystems() {
  systems.clear();

  systems.addSystem("paddle_system", std::make_unique<Systems::PaddleSystem>());
  systems.addSystem("ball_system", std::make_unique<Systems::BallMovementSystem>());
  systems.addSystem("collision_system", std::make_unique<Systems::BounceSystem>(),
                    {"paddle_system", "ball_system"});
  systems.addSystem("winner_system", std::make_unique<Systems::WinnerSystem>(),
                    {"ball_system"});

  systems.buildOrder();
}

void PongSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  if (!scenario) {
    throw std::invalid_argument("PongSimulator: scenario must not be null");
  }
  scenarioPtr = std::move(scenario);
  config = scenarioPtr->getConfig();
  systems.setGameConfig(config);
  spawner.setGameConfig(config);
  reset();
}

void PongSimulator::reset() {
  registry.clear();
  scenarioPtr->createEntities(registry);
  spawner.reset();
  DEBUG_MSG(DEBUG_LEVEL_BASIC, "Match reset, serving in "
            << config.BallSpawnDelaySeconds << "s\n");
}

void PongSimulator::tick(float deltaSeconds, const AxisMap& axes) {
  PROFILE_SCOPE("PongSimulator::tick");

  Match::setFrameInput(registry, deltaSeconds, axes);
  systems.run(registry);
  spawner.update(registry);
}

Components::ScoreBoard PongSimulator::getScoreBoard() const {
  auto state = Match::findMatchState(registry);
  if (state == entt::null) {
    return {};
  }
  return registry.get<Components::ScoreBoard>(state);
}

bool PongSimulator::hasBall() const {
  return Match::findBall(registry).has_value();
}
