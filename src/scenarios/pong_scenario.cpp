#include "pong/scenarios/pong_scenario.hpp"

#include "pong/components/basic.hpp"
#include "pong/components/match.hpp"
#include "pong/core/debug.hpp"
#include "pong/core/match_state.hpp"
#include "pong/entities/entity_factory.hpp"

namespace {
// Score labels sit either side of the window's top centre
constexpr float LabelOffsetX = 50.0f;
constexpr float LabelOffsetY = 20.0f;
}

GameConfig PongScenario::getConfig() const {
    return config;
}

void PongScenario::createEntities(entt::registry &registry) const {
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "Creating Pong scene...\n");

    auto state = Match::createMatchState(registry);

    Entities::EntityFactory::createPaddle(registry, Components::Side::Left, config);
    Entities::EntityFactory::createPaddle(registry, Components::Side::Right, config);

    auto& text = registry.get<Components::ScoreText>(state);
    text.leftScore = Entities::EntityFactory::createLabel(registry, "0", -LabelOffsetX, LabelOffsetY);
    text.rightScore = Entities::EntityFactory::createLabel(registry, "0", LabelOffsetX, LabelOffsetY);

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "...Created paddles and scoreboard.\n");
}
