/**
 * @file system_graph.hpp
 * @brief Named ECS systems ordered by their declared dependencies
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <entt/entt.hpp>

#include "pong/core/game_config.hpp"
#include "pong/systems/i_system.hpp"

/**
 * @class SystemGraph
 * @brief Directed acyclic graph of systems evaluated once per tick.
 *
 * A system runs only after every system it depends on has run in the same
 * tick. Systems with no ordering constraint between them run in the order they
 * were added.
 */
class SystemGraph {
public:
    /**
     * @brief Registers a system.
     * @param name Unique system name
     * @param system The system, owned by the graph
     * @param dependencies Names of systems that must run first
     * @throws std::runtime_error if @p name is already registered
     */
    void addSystem(const std::string& name,
                   std::unique_ptr<Systems::ISystem> system,
                   std::vector<std::string> dependencies = {});

    /**
     * @brief Resolves the execution order.
     * @throws std::runtime_error on an unknown dependency or a cycle
     */
    void buildOrder();

    /**
     * @brief Runs every system once, in resolved order.
     *
     * Resolves the order first if systems were added since the last build.
     */
    void run(entt::registry& registry);

    /** @brief Pushes a configuration into every registered system. */
    void setGameConfig(const GameConfig& config);

    /** @brief Names in execution order (empty until built). */
    std::vector<std::string> order() const;

    std::size_t size() const { return nodes.size(); }

    void clear();

private:
    struct Node {
        std::string name;
        std::unique_ptr<Systems::ISystem> system;
        std::vector<std::string> dependencies;
    };

    std::vector<Node> nodes;
    std::vector<std::size_t> executionOrder;
    bool dirty = false;

    std::size_t indexOf(const std::string& name) const;
};
