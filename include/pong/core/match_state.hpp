/**
 * @file match_state.hpp
 * @brief Accessors for the match-wide singleton entity and the optional ball
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <entt/entt.hpp>

#include "pong/components/match.hpp"

namespace Match {

/**
 * @brief Creates the match-state entity carrying ScoreBoard (0:0), ScoreText,
 *        MatchEvents, FrameTime and InputAxes.
 */
entt::entity createMatchState(entt::registry& registry);

/**
 * @brief The match-state entity, or entt::null if the scene has none.
 */
entt::entity findMatchState(const entt::registry& registry);

/**
 * @brief The live ball, if any. At most one exists at a time.
 */
std::optional<entt::entity> findBall(const entt::registry& registry);

/**
 * @brief Event totals on the match state, or nullptr without one.
 */
Components::MatchEvents* matchEvents(entt::registry& registry);

/**
 * @brief Seconds elapsed this tick; 0 when there is no match state.
 */
float frameDelta(const entt::registry& registry);

/**
 * @brief Axis value for an action, clamped to [-1, 1]; 0 when absent.
 */
float inputAxis(const entt::registry& registry, const std::string& action);

/**
 * @brief Publishes this tick's elapsed time and input axes on the match state.
 */
void setFrameInput(entt::registry& registry,
                   float deltaSeconds,
                   const std::unordered_map<std::string, float>& axes);

} // namespace Match
