#include <gtest/gtest.h>
#include "pong/core/coordinates.hpp"

TEST(CoordinatesTest, ArenaFillsWindow) {
    GameConfig config;
    Simulation::Coordinates coords(config, 600);

    EXPECT_FLOAT_EQ(coords.unitsToPixels(config.ArenaWidth), 600.0f);
    EXPECT_FLOAT_EQ(coords.toScreenX(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(coords.toScreenX(50.0f), 300.0f);
}

TEST(CoordinatesTest, YAxisIsFlipped) {
    GameConfig config;
    Simulation::Coordinates coords(config, 600);

    EXPECT_FLOAT_EQ(coords.toScreenY(config.ArenaHeight), 0.0f);
    EXPECT_FLOAT_EQ(coords.toScreenY(0.0f), 600.0f);
    EXPECT_FLOAT_EQ(coords.toScreenY(25.0f), 450.0f);
}

TEST(CoordinatesTest, WideArenaFitsLongestSide) {
    GameConfig config;
    config.ArenaWidth = 200.0f;
    Simulation::Coordinates coords(config, 600);

    EXPECT_FLOAT_EQ(coords.unitsToPixels(1.0f), 3.0f);
    EXPECT_FLOAT_EQ(coords.toScreenX(config.ArenaWidth), 600.0f);
}
