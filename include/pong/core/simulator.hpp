/**
 * @file simulator.hpp
 * @brief Owns the ECS registry, the system graph and the scene lifecycle.
 */

#pragma once

#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include <entt/entt.hpp>

#include "pong/components/match.hpp"
#include "pong/core/game_config.hpp"
#include "pong/core/system_graph.hpp"
#include "pong/scenarios/ball_spawner.hpp"
#include "pong/scenarios/i_scenario.hpp"

/**
 * @class PongSimulator
 * @brief Steps the Pong simulation one discrete tick at a time.
 *
 * Per tick: publish frame time and input, run the system graph
 * (paddle, ball movement, then bounce and winner), then let the ball spawner
 * advance its serve timer.
 */
class PongSimulator {
public:
    using AxisMap = std::unordered_map<std::string, float>;

    explicit PongSimulator(std::unique_ptr<IScenario> scenario,
                           unsigned int seed = std::random_device{}());
    ~PongSimulator();

    PongSimulator(const PongSimulator&) = delete;
    PongSimulator& operator=(const PongSimulator&) = delete;

    /**
     * @brief Replaces the scenario and rebuilds the scene
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Clears the registry and recreates the scenario's entities
     */
    void reset();

    /**
     * @brief Steps the ECS systems for one tick
     * @param deltaSeconds Elapsed time for this tick
     * @param axes Input axis values keyed by action name
     */
    void tick(float deltaSeconds, const AxisMap& axes = {});

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    const GameConfig& getConfig() const { return config; }

    /** @brief Current score (0:0 if the scene has no match state) */
    Components::ScoreBoard getScoreBoard() const;

    /** @brief True while a ball is in play */
    bool hasBall() const;

    /** @brief Resolved system execution order */
    std::vector<std::string> systemOrder() const { return systems.order(); }

private:
    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    GameConfig config;
    SystemGraph systems;
    BallSpawner spawner;

    void createSystems();
};
