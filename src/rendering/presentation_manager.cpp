/**
 * @fileoverview presentation_manager.cpp
 * @brief Implementation of PresentationManager.
 */

#include "pong/rendering/presentation_manager.hpp"

#include <iostream>

#include "pong/components/basic.hpp"
#include "pong/core/assets.hpp"
#include "pong/core/constants.hpp"
#include "pong/core/debug.hpp"
#include "pong/core/profile.hpp"

PresentationManager::PresentationManager(const GameConfig& config)
    : fontLoaded(false)
    , screenLength(PongConstants::ScreenLength)
    , coordinates(config, PongConstants::ScreenLength)
{}

bool PresentationManager::init() {
    window.create(sf::VideoMode(screenLength, screenLength), PongConstants::WindowTitle,
                  sf::Style::Titlebar | sf::Style::Close);
    if (!window.isOpen()) {
        std::cerr << "Failed to create the game window" << std::endl;
        return false;
    }
    window.setVerticalSyncEnabled(true);

    std::string const fontPath = Assets::findFirstReadable(PongConstants::FontSearchPaths);
    if (fontPath.empty() || !font.loadFromFile(fontPath)) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "No usable font found, score and pause text disabled\n");
        return true;
    }
    fontLoaded = true;
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Loaded font " << fontPath << "\n");
    return true;
}

void PresentationManager::clear() { window.clear(sf::Color::Black); }

void PresentationManager::present() { window.display(); }

void PresentationManager::renderFrame(const entt::registry& registry, bool paused) {
    PROFILE_SCOPE("PresentationManager::renderFrame");

    clear();
    renderCenterLine();
    renderPaddles(registry);
    renderBall(registry);
    renderLabels(registry);
    if (paused) {
        renderPauseOverlay();
    }
    present();
}

void PresentationManager::renderCenterLine() {
    float const x = static_cast<float>(screenLength) * 0.5f;
    float const dash = 12.0f;
    for (float y = 0.0f; y < static_cast<float>(screenLength); y += dash * 2.0f) {
        sf::RectangleShape segment(sf::Vector2f(2.0f, dash));
        segment.setPosition(x - 1.0f, y);
        segment.setFillColor(sf::Color(90, 90, 90));
        window.draw(segment);
    }
}

void PresentationManager::renderPaddles(const entt::registry& registry) {
    auto view = registry.view<const Components::Paddle, const Components::Transform>();
    for (auto &&[entity, paddle, transform] : view.each()) {
        float const w = coordinates.unitsToPixels(paddle.width);
        float const h = coordinates.unitsToPixels(paddle.height);

        sf::RectangleShape shape(sf::Vector2f(w, h));
        shape.setOrigin(w * 0.5f, h * 0.5f);
        shape.setPosition(coordinates.toScreenX(transform.x), coordinates.toScreenY(transform.y));
        shape.setFillColor(sf::Color::White);
        window.draw(shape);
    }
}

void PresentationManager::renderBall(const entt::registry& registry) {
    auto view = registry.view<const Components::Ball, const Components::Transform>();
    for (auto &&[entity, ball, transform] : view.each()) {
        float const r = coordinates.unitsToPixels(ball.radius);

        sf::CircleShape shape(r);
        shape.setOrigin(r, r);
        shape.setPosition(coordinates.toScreenX(transform.x), coordinates.toScreenY(transform.y));
        shape.setFillColor(sf::Color::White);
        window.draw(shape);
    }
}

void PresentationManager::renderLabels(const entt::registry& registry) {
    if (!fontLoaded) {
        return;
    }
    float const centerX = static_cast<float>(screenLength) * 0.5f;
    auto view = registry.view<const Components::UiText>();
    for (auto entity : view) {
        const auto& label = registry.get<Components::UiText>(entity);
        renderText(label.text, centerX + label.offsetX, label.offsetY, label.characterSize);
    }
}

void PresentationManager::renderPauseOverlay() {
    sf::RectangleShape shade(sf::Vector2f(static_cast<float>(screenLength),
                                          static_cast<float>(screenLength)));
    shade.setFillColor(sf::Color(0, 0, 0, 140));
    window.draw(shade);

    float const center = static_cast<float>(screenLength) * 0.5f;
    renderText("PAUSED", center, center, 40);
}

void PresentationManager::renderText(const std::string& text, float x, float y,
                                     unsigned int size, sf::Color color) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);

    // Anchor on the top-middle of the text's bounds
    sf::FloatRect const bounds = sfText.getLocalBounds();
    sfText.setOrigin(bounds.left + bounds.width * 0.5f, bounds.top);
    sfText.setPosition(x, y);
    window.draw(sfText);
}
