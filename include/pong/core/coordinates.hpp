/**
 * @file coordinates.hpp
 * @brief Conversion between arena units and window pixels
 *
 * Arena y grows upward; window y grows downward, so y is flipped.
 */
#pragma once

#include "pong/core/constants.hpp"
#include "pong/core/game_config.hpp"

namespace Simulation {

/**
 * @class Coordinates
 * @brief Maps arena space onto a square region of the window
 */
class Coordinates {
public:
    /**
     * @brief Construct a new Coordinates converter
     *
     * @param config Arena dimensions
     * @param screenSize Window size in pixels (default: from PongConstants)
     */
    explicit Coordinates(const GameConfig& config,
                         unsigned int screenSize = PongConstants::ScreenLength);

    /** @brief Arena length to pixel length */
    float unitsToPixels(float units) const;

    /** @brief Arena x to window x */
    float toScreenX(float x) const;

    /** @brief Arena y to window y */
    float toScreenY(float y) const;

private:
    void updateConfig(const GameConfig& config);

    float pixelsPerUnit;
    float arenaHeight;
    unsigned int screenSize;
};

} // namespace Simulation
