#include <gtest/gtest.h>

#include "pong/components/basic.hpp"
#include "pong/core/match_state.hpp"
#include "pong/entities/entity_factory.hpp"
#include "pong/systems/bounce.hpp"
#include "pong/systems/movement.hpp"

using namespace Systems;

class BounceSystemTest : public ::testing::Test {
protected:
    entt::registry registry;
    GameConfig config;
    BounceSystem system;
    entt::entity left = entt::null;
    entt::entity right = entt::null;

    void SetUp() override {
        system.setGameConfig(config);
        Match::createMatchState(registry);
        left = Entities::EntityFactory::createPaddle(registry, Components::Side::Left, config);
        right = Entities::EntityFactory::createPaddle(registry, Components::Side::Right, config);
    }

    entt::entity createBall(float x, float y, float vx, float vy) {
        auto ball = Entities::EntityFactory::createBall(registry, Vector(vx, vy), config);
        auto& t = registry.get<Components::Transform>(ball);
        t.x = x;
        t.y = y;
        return ball;
    }

    Vector velocity(entt::entity ball) {
        return registry.get<Components::Ball>(ball).velocity;
    }
};

TEST_F(BounceSystemTest, NoBallIsNoOp) {
    system.update(registry);
    EXPECT_FALSE(Match::findBall(registry).has_value());
}

TEST_F(BounceSystemTest, FreeBallIsUntouched) {
    auto ball = createBall(50.0f, 50.0f, 75.0f, 50.0f);
    system.update(registry);
    EXPECT_EQ(velocity(ball), Vector(75.0f, 50.0f));
}

TEST_F(BounceSystemTest, ReflectsOffRightPaddleWhenApproaching) {
    // Right paddle spans x in [96, 100]
    auto ball = createBall(95.0f, 50.0f, 75.0f, 50.0f);
    system.update(registry);

    EXPECT_FLOAT_EQ(velocity(ball).x, -75.0f);
    EXPECT_FLOAT_EQ(velocity(ball).y, 50.0f);
}

TEST_F(BounceSystemTest, ReflectsOffLeftPaddleWhenApproaching) {
    auto ball = createBall(5.0f, 45.0f, -75.0f, -50.0f);
    system.update(registry);

    EXPECT_FLOAT_EQ(velocity(ball).x, 75.0f);
    EXPECT_FLOAT_EQ(velocity(ball).y, -50.0f);
}

TEST_F(BounceSystemTest, IgnoresPaddleWhenMovingAway) {
    auto ball = createBall(95.0f, 50.0f, -75.0f, 50.0f);
    system.update(registry);
    EXPECT_FLOAT_EQ(velocity(ball).x, -75.0f);
}

TEST_F(BounceSystemTest, PaddleOverlapReflectsOnlyOnce) {
    auto ball = createBall(97.0f, 50.0f, 75.0f, 0.0f);
    for (int i = 0; i < 3; ++i) {
        system.update(registry);
    }
    EXPECT_FLOAT_EQ(velocity(ball).x, -75.0f);
}

TEST_F(BounceSystemTest, MissesPaddleOutsideItsSpan) {
    // Paddle covers y in [42, 58]; ball edge stays above it
    auto ball = createBall(95.0f, 61.0f, 75.0f, 50.0f);
    system.update(registry);
    EXPECT_FLOAT_EQ(velocity(ball).x, 75.0f);
}

TEST_F(BounceSystemTest, ReflectsOffTopWall) {
    auto ball = createBall(50.0f, 98.5f, 75.0f, 50.0f);
    system.update(registry);

    EXPECT_FLOAT_EQ(velocity(ball).x, 75.0f);
    EXPECT_FLOAT_EQ(velocity(ball).y, -50.0f);
}

TEST_F(BounceSystemTest, ReflectsOffBottomWall) {
    auto ball = createBall(50.0f, 1.0f, -75.0f, -50.0f);
    system.update(registry);

    EXPECT_FLOAT_EQ(velocity(ball).x, -75.0f);
    EXPECT_FLOAT_EQ(velocity(ball).y, 50.0f);
}

TEST_F(BounceSystemTest, WallOverlapAcrossThreeFramesFlipsOnce) {
    auto ball = createBall(50.0f, 99.0f, 75.0f, 50.0f);

    int flips = 0;
    float previous = velocity(ball).y;
    for (int frame = 0; frame < 3; ++frame) {
        system.update(registry);
        if (velocity(ball).y != previous) {
            ++flips;
            previous = velocity(ball).y;
        }
    }

    EXPECT_EQ(flips, 1);
    EXPECT_FLOAT_EQ(velocity(ball).y, -50.0f);
}

TEST_F(BounceSystemTest, WallContactWithMovementFlipsOnce) {
    BallMovementSystem movement;
    movement.setGameConfig(config);
    auto ball = createBall(50.0f, 98.5f, 0.0f, 50.0f);
    Match::setFrameInput(registry, 1.0f / 60.0f, {});

    int flips = 0;
    for (int frame = 0; frame < 3; ++frame) {
        float const before = velocity(ball).y;
        movement.update(registry);
        system.update(registry);
        if (velocity(ball).y != before) {
            ++flips;
        }
    }
    EXPECT_EQ(flips, 1);
}

TEST_F(BounceSystemTest, CornerContactReflectsBothComponents) {
    // Move the right paddle to the top so the ball touches it and the wall at once
    registry.get<Components::Transform>(right).y = config.ArenaHeight - config.PaddleHeight * 0.5f;
    auto ball = createBall(95.0f, 98.5f, 75.0f, 50.0f);
    system.update(registry);

    EXPECT_FLOAT_EQ(velocity(ball).x, -75.0f);
    EXPECT_FLOAT_EQ(velocity(ball).y, -50.0f);
}

TEST_F(BounceSystemTest, BouncesPreserveSpeed) {
    auto ball = createBall(95.0f, 99.0f, 75.0f, 50.0f);
    registry.get<Components::Transform>(right).y = 92.0f;
    float const speed = velocity(ball).length();

    system.update(registry);
    EXPECT_FLOAT_EQ(velocity(ball).length(), speed);
}

TEST_F(BounceSystemTest, MovingTowardPerSide) {
    EXPECT_TRUE(BounceSystem::movingToward(Components::Side::Left, -1.0f));
    EXPECT_FALSE(BounceSystem::movingToward(Components::Side::Left, 1.0f));
    EXPECT_TRUE(BounceSystem::movingToward(Components::Side::Right, 1.0f));
    EXPECT_FALSE(BounceSystem::movingToward(Components::Side::Right, -1.0f));
    EXPECT_FALSE(BounceSystem::movingToward(Components::Side::Right, 0.0f));
}

TEST_F(BounceSystemTest, CountsAppliedReflections) {
    // Corner contact: right paddle and top wall in the same tick
    createBall(95.0f, 98.5f, 75.0f, 50.0f);
    registry.get<Components::Transform>(right).y = 92.0f;
    system.update(registry);

    const auto* events = Match::matchEvents(registry);
    ASSERT_NE(events, nullptr);
    EXPECT_EQ(events->paddleHits, 1u);
    EXPECT_EQ(events->wallHits, 1u);

    // Still overlapping but now moving away: nothing new to count
    system.update(registry);
    EXPECT_EQ(events->paddleHits, 1u);
    EXPECT_EQ(events->wallHits, 1u);
}
