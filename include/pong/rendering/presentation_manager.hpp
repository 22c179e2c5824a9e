/**
 * @fileoverview presentation_manager.hpp
 * @brief Owns the SFML window and draws the arena, paddles, ball and score.
 */

#pragma once

#include <string>
#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "pong/core/coordinates.hpp"
#include "pong/core/game_config.hpp"

/**
 * @class PresentationManager
 * @brief Window lifetime and per-frame drawing. Reads the registry, never writes it.
 */
class PresentationManager {
public:
    explicit PresentationManager(const GameConfig& config);
    ~PresentationManager() = default;

    PresentationManager(const PresentationManager&) = delete;
    PresentationManager& operator=(const PresentationManager&) = delete;

    /**
     * @brief Creates the window and loads the score font
     *
     * A missing font is not fatal: the arena still draws, without text.
     *
     * @return false if the window could not be created
     */
    bool init();

    /** @brief Clears the screen to black */
    void clear();

    /** @brief Presents the rendered frame to display */
    void present();

    /**
     * @brief Draws one complete frame
     * @param registry Registry holding paddles, ball and labels
     * @param paused Whether to draw the pause overlay
     */
    void renderFrame(const entt::registry& registry, bool paused);

    sf::RenderWindow& getWindow() { return window; }
    bool isWindowOpen() const { return window.isOpen(); }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded;
    unsigned int screenLength;
    Simulation::Coordinates coordinates;

    void renderCenterLine();
    void renderPaddles(const entt::registry& registry);
    void renderBall(const entt::registry& registry);
    void renderLabels(const entt::registry& registry);
    void renderPauseOverlay();
    void renderText(const std::string& text, float x, float y,
                    unsigned int size, sf::Color color = sf::Color::White);
};
