#include "pong/core/match_state.hpp"

#include "pong/components/basic.hpp"
#include "pong/components/match.hpp"
#include "pong/math/vector_math.hpp"

namespace Match {

entt::entity createMatchState(entt::registry& registry) {
    auto state = registry.create();
    registry.emplace<Components::MatchState>(state);
    registry.emplace<Components::ScoreBoard>(state);
    registry.emplace<Components::ScoreText>(state);
    registry.emplace<Components::MatchEvents>(state);
    registry.emplace<Components::FrameTime>(state);
    registry.emplace<Components::InputAxes>(state);
    return state;
}

entt::entity findMatchState(const entt::registry& registry) {
    auto view = registry.view<const Components::MatchState>();
    if (view.begin() == view.end()) {
        return entt::null;
    }
    return *view.begin();
}

std::optional<entt::entity> findBall(const entt::registry& registry) {
    auto view = registry.view<const Components::Ball, const Components::Transform>();
    auto it = view.begin();
    if (it == view.end()) {
        return std::nullopt;
    }
    return *it;
}

Components::MatchEvents* matchEvents(entt::registry& registry) {
    auto state = findMatchState(registry);
    if (state == entt::null) {
        return nullptr;
    }
    return registry.try_get<Components::MatchEvents>(state);
}

float frameDelta(const entt::registry& registry) {
    auto state = findMatchState(registry);
    if (state == entt::null) {
        return 0.0f;
    }
    const auto* frame = registry.try_get<Components::FrameTime>(state);
    return frame ? frame->deltaSeconds : 0.0f;
}

float inputAxis(const entt::registry& registry, const std::string& action) {
    auto state = findMatchState(registry);
    if (state == entt::null) {
        return 0.0f;
    }
    const auto* input = registry.try_get<Components::InputAxes>(state);
    if (!input) {
        return 0.0f;
    }
    auto it = input->values.find(action);
    if (it == input->values.end()) {
        return 0.0f;
    }
    return clampf(it->second, -1.0f, 1.0f);
}

void setFrameInput(entt::registry& registry,
                   float deltaSeconds,
                   const std::unordered_map<std::string, float>& axes) {
    auto state = findMatchState(registry);
    if (state == entt::null) {
        return;
    }
    registry.emplace_or_replace<Components::FrameTime>(state, deltaSeconds);
    registry.emplace_or_replace<Components::InputAxes>(state, axes);
}

} // namespace Match
