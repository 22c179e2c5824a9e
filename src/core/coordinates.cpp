/**
 * @file coordinates.cpp
 * @brief Implementation of coordinate conversion utilities
 */

#include "pong/core/coordinates.hpp"

#include <algorithm>

namespace Simulation {

Coordinates::Coordinates(const GameConfig& config, unsigned int screenSize)
    : pixelsPerUnit(1.0f)
    , arenaHeight(config.ArenaHeight)
    , screenSize(screenSize)
{
    updateConfig(config);
}

float Coordinates::unitsToPixels(float units) const {
    return units * pixelsPerUnit;
}

float Coordinates::toScreenX(float x) const {
    return x * pixelsPerUnit;
}

float Coordinates::toScreenY(float y) const {
    return (arenaHeight - y) * pixelsPerUnit;
}

void Coordinates::updateConfig(const GameConfig& config) {
    arenaHeight = config.ArenaHeight;
    // Fit the larger arena dimension to the window
    float const longest = std::max(config.ArenaWidth, config.ArenaHeight);
    pixelsPerUnit = static_cast<float>(screenSize) / longest;
}

} // namespace Simulation
