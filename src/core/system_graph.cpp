/**
 * @file system_graph.cpp
 * @brief Kahn's-algorithm ordering for SystemGraph.
 */

#include "pong/core/system_graph.hpp"

#include <stdexcept>
#include <utility>

#include "pong/core/profile.hpp"

namespace {
constexpr std::size_t npos = static_cast<std::size_t>(-1);
}

std::size_t SystemGraph::indexOf(const std::string& name) const {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].name == name) {
            return i;
        }
    }
    return npos;
}

void SystemGraph::addSystem(const std::string& name,
                            std::unique_ptr<Systems::ISystem> system,
                            std::vector<std::string> dependencies) {
    if (!system) {
        throw std::runtime_error("SystemGraph: system '" + name + "' is null");
    }
    if (indexOf(name) != npos) {
        throw std::runtime_error("SystemGraph: duplicate system '" + name + "'");
    }
    nodes.push_back(Node{name, std::move(system), std::move(dependencies)});
    dirty = true;
}

void SystemGraph::buildOrder() {
    std::size_t const count = nodes.size();
    std::vector<std::size_t> inDegree(count, 0);
    std::vector<std::vector<std::size_t>> dependents(count);

    for (std::size_t i = 0; i < count; ++i) {
        for (const auto& dep : nodes[i].dependencies) {
            std::size_t const d = indexOf(dep);
            if (d == npos) {
                throw std::runtime_error("SystemGraph: system '" + nodes[i].name +
                                         "' depends on unknown system '" + dep + "'");
            }
            dependents[d].push_back(i);
            inDegree[i] += 1;
        }
    }

    // Always take the earliest-added ready node so unconstrained systems keep
    // their insertion order.
    std::vector<std::size_t> order;
    order.reserve(count);
    std::vector<bool> done(count, false);
    while (order.size() < count) {
        std::size_t next = npos;
        for (std::size_t i = 0; i < count; ++i) {
            if (!done[i] && inDegree[i] == 0) {
                next = i;
                break;
            }
        }
        if (next == npos) {
            throw std::runtime_error("SystemGraph: dependency cycle detected");
        }
        done[next] = true;
        order.push_back(next);
        for (std::size_t dependent : dependents[next]) {
            inDegree[dependent] -= 1;
        }
    }

    executionOrder = std::move(order);
    dirty = false;
}

void SystemGraph::run(entt::registry& registry) {
    PROFILE_SCOPE("SystemGraph::run");
    if (dirty) {
        buildOrder();
    }
    for (std::size_t index : executionOrder) {
        nodes[index].system->update(registry);
    }
}

void SystemGraph::setGameConfig(const GameConfig& config) {
    for (auto& node : nodes) {
        node.system->setGameConfig(config);
    }
}

std::vector<std::string> SystemGraph::order() const {
    std::vector<std::string> names;
    if (dirty) {
        return names;
    }
    names.reserve(executionOrder.size());
    for (std::size_t index : executionOrder) {
        names.push_back(nodes[index].name);
    }
    return names;
}

void SystemGraph::clear() {
    nodes.clear();
    executionOrder.clear();
    dirty = false;
}
