#include <gtest/gtest.h>
#include <iterator>
#include <string>

#include "pong/components/basic.hpp"
#include "pong/components/match.hpp"
#include "pong/core/match_state.hpp"
#include "pong/entities/entity_factory.hpp"
#include "pong/scenarios/pong_scenario.hpp"
#include "pong/systems/winner.hpp"

using namespace Systems;

class WinnerSystemTest : public ::testing::Test {
protected:
    entt::registry registry;
    GameConfig config;
    WinnerSystem system;
    entt::entity state = entt::null;

    void SetUp() override {
        system.setGameConfig(config);
        PongScenario(config).createEntities(registry);
        state = Match::findMatchState(registry);
    }

    entt::entity createBall(float x, float y) {
        auto ball = Entities::EntityFactory::createBall(registry, Vector(75.0f, 50.0f), config);
        auto& t = registry.get<Components::Transform>(ball);
        t.x = x;
        t.y = y;
        return ball;
    }

    const Components::ScoreBoard& board() {
        return registry.get<Components::ScoreBoard>(state);
    }

    const std::string& labelText(Components::Side side) {
        const auto& text = registry.get<Components::ScoreText>(state);
        auto label = side == Components::Side::Left ? text.leftScore : text.rightScore;
        return registry.get<Components::UiText>(label).text;
    }
};

TEST_F(WinnerSystemTest, SceneStartsAtZero) {
    EXPECT_EQ(board().scoreLeft, 0);
    EXPECT_EQ(board().scoreRight, 0);
    EXPECT_EQ(labelText(Components::Side::Left), "0");
    EXPECT_EQ(labelText(Components::Side::Right), "0");
}

TEST_F(WinnerSystemTest, NoBallIsNoOp) {
    const auto& text = registry.get<Components::ScoreText>(state);
    auto const leftLabel = text.leftScore;
    auto const rightLabel = text.rightScore;

    system.update(registry);

    EXPECT_EQ(board().scoreLeft, 0);
    EXPECT_EQ(board().scoreRight, 0);
    EXPECT_TRUE(registry.valid(state));
    EXPECT_TRUE(registry.valid(leftLabel));
    EXPECT_TRUE(registry.valid(rightLabel));

    auto paddles = registry.view<Components::Paddle>();
    EXPECT_EQ(std::distance(paddles.begin(), paddles.end()), 2);
}

TEST_F(WinnerSystemTest, BallInsideArenaDoesNotScore) {
    auto ball = createBall(50.0f, 50.0f);
    system.update(registry);

    EXPECT_TRUE(registry.valid(ball));
    EXPECT_EQ(board().scoreLeft, 0);
    EXPECT_EQ(board().scoreRight, 0);
}

TEST_F(WinnerSystemTest, BallPartlyOffEdgeDoesNotScore) {
    // Centre past the edge but not by a full radius
    auto ball = createBall(-1.5f, 50.0f);
    system.update(registry);

    EXPECT_TRUE(registry.valid(ball));
    EXPECT_EQ(board().scoreRight, 0);
}

TEST_F(WinnerSystemTest, LeavingLeftScoresForRight) {
    auto ball = createBall(-config.BallRadius - 0.5f, 50.0f);
    system.update(registry);

    EXPECT_FALSE(registry.valid(ball));
    EXPECT_FALSE(Match::findBall(registry).has_value());
    EXPECT_EQ(board().scoreRight, 1);
    EXPECT_EQ(board().scoreLeft, 0);
    EXPECT_EQ(labelText(Components::Side::Right), "1");
    EXPECT_EQ(labelText(Components::Side::Left), "0");
}

TEST_F(WinnerSystemTest, LeavingRightScoresForLeft) {
    auto ball = createBall(config.ArenaWidth + config.BallRadius + 0.5f, 20.0f);
    system.update(registry);

    EXPECT_FALSE(registry.valid(ball));
    EXPECT_EQ(board().scoreLeft, 1);
    EXPECT_EQ(board().scoreRight, 0);
    EXPECT_EQ(labelText(Components::Side::Left), "1");
}

TEST_F(WinnerSystemTest, ScoresAccumulateAcrossRounds) {
    for (int round = 0; round < 3; ++round) {
        createBall(-10.0f, 50.0f);
        system.update(registry);
        system.update(registry);  // second run has no ball and must not score again
    }
    createBall(150.0f, 50.0f);
    system.update(registry);

    EXPECT_EQ(board().scoreRight, 3);
    EXPECT_EQ(board().scoreLeft, 1);
    EXPECT_EQ(labelText(Components::Side::Right), "3");
    EXPECT_EQ(labelText(Components::Side::Left), "1");
}

TEST_F(WinnerSystemTest, ScoringSideBoundaries) {
    float const r = config.BallRadius;
    EXPECT_FALSE(system.scoringSide(-r, r).has_value());
    EXPECT_EQ(system.scoringSide(-r - 0.01f, r), Components::Side::Right);
    EXPECT_FALSE(system.scoringSide(config.ArenaWidth + r, r).has_value());
    EXPECT_EQ(system.scoringSide(config.ArenaWidth + r + 0.01f, r), Components::Side::Left);
}

TEST_F(WinnerSystemTest, CountsPointsInMatchEvents) {
    createBall(-10.0f, 50.0f);
    system.update(registry);
    createBall(150.0f, 50.0f);
    system.update(registry);
    system.update(registry);

    const auto& events = registry.get<Components::MatchEvents>(state);
    EXPECT_EQ(events.points, 2u);
    EXPECT_EQ(events.paddleHits, 0u);
}
