#include "pong/systems/winner.hpp"

#include <string>

#include "pong/components/match.hpp"
#include "pong/core/debug.hpp"
#include "pong/core/match_state.hpp"
#include "pong/core/profile.hpp"

namespace Systems {

void WinnerSystem::setGameConfig(const GameConfig& config) {
    gameConfig = config;
}

std::optional<Components::Side> WinnerSystem::scoringSide(float x, float radius) const {
    if (x < -radius) {
        return Components::Side::Right;
    }
    if (x > gameConfig.ArenaWidth + radius) {
        return Components::Side::Left;
    }
    return std::nullopt;
}

void WinnerSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("WinnerSystem");

    auto ball = Match::findBall(registry);
    if (!ball) {
        return;
    }

    const auto& transform = registry.get<Components::Transform>(*ball);
    const auto& body = registry.get<Components::Ball>(*ball);

    auto scorer = scoringSide(transform.x, body.radius);
    if (!scorer) {
        return;
    }

    registry.destroy(*ball);
    awardPoint(registry, *scorer);
}

void WinnerSystem::awardPoint(entt::registry &registry, Components::Side scorer) {
    auto state = Match::findMatchState(registry);
    if (state == entt::null) {
        return;
    }

    auto& board = registry.get<Components::ScoreBoard>(state);
    int& score = scorer == Components::Side::Left ? board.scoreLeft : board.scoreRight;
    score += 1;
    if (auto* events = registry.try_get<Components::MatchEvents>(state)) {
        events->points += 1;
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC,
              "Player " << Components::sideName(scorer) << " scores: "
              << board.scoreLeft << " - " << board.scoreRight << "\n");

    const auto* text = registry.try_get<Components::ScoreText>(state);
    if (!text) {
        return;
    }
    entt::entity const label = scorer == Components::Side::Left ? text->leftScore : text->rightScore;
    if (registry.valid(label)) {
        if (auto* ui = registry.try_get<Components::UiText>(label)) {
            ui->text = std::to_string(score);
        }
    }
}

} // namespace Systems
