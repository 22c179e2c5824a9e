/**
 * @file game_manager.cpp
 * @brief Implementation of GameManager.
 */

#include "pong/core/game_manager.hpp"

#include <iostream>
#include <memory>

#include "pong/core/debug.hpp"
#include "pong/core/profile.hpp"
#include "pong/scenarios/pong_scenario.hpp"

GameManager& GameManager::getInstance() {
  static GameManager instance;
  return instance;
}

GameManager::GameManager()
    : simulator(std::make_unique<PongScenario>())
    , presentation(simulator.getConfig())
    , bindings(InputBindings::defaults())
    , running(true)
    , paused(false)
    , tickInterval(sf::seconds(simulator.getConfig().SecondsPerTick))
{}

bool GameManager::init() {
  if (!presentation.init()) {
    std::cerr << "Presentation initialization failed." << std::endl;
    return false;
  }
  if (!sounds.init()) {
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "Sound effects unavailable, continuing without audio\n");
  }
  return true;
}

void GameManager::run() {
  sf::Clock frameClock;
  sf::Time accumulator = sf::Time::Zero;

  while (running && presentation.isWindowOpen()) {
    sf::Time elapsed = frameClock.restart();
    if (elapsed > maxFrameTime) {
      elapsed = maxFrameTime;
    }
    accumulator += elapsed;

    handleEvents();

    while (accumulator >= tickInterval) {
      tick();
      accumulator -= tickInterval;
    }
    sounds.update(simulator.getRegistry());

    render();

    timeSinceLastProfilerPrint += elapsed;
    if (timeSinceLastProfilerPrint >= profilerPrintInterval) {
      Profiling::Profiler::printStats();
      timeSinceLastProfilerPrint = sf::Time::Zero;
    }
  }

  presentation.getWindow().close();
}

void GameManager::handleEvents() {
  sf::RenderWindow& window = presentation.getWindow();

  sf::Event event;
  while (window.pollEvent(event)) {
    if (event.type == sf::Event::Closed) {
      running = false;
    } else if (event.type == sf::Event::KeyPressed) {
      handleKeyPressed(event.key.code);
    } else if (event.type == sf::Event::LostFocus && !paused) {
      togglePause();
    }
  }
}

void GameManager::handleKeyPressed(sf::Keyboard::Key key) {
  switch (key) {
    case sf::Keyboard::Escape:
      running = false;
      break;
    case sf::Keyboard::P:
      togglePause();
      break;
    case sf::Keyboard::R:
      resetMatch();
      break;
    default:
      break;
  }
}

void GameManager::tick() {
  if (paused) {
    return;
  }
  simulator.tick(tickInterval.asSeconds(), bindings.sampleKeyboard());
}

void GameManager::render() {
  presentation.renderFrame(simulator.getRegistry(), paused);
}

void GameManager::togglePause() {
  paused = !paused;
}

void GameManager::resetMatch() {
  simulator.reset();
  paused = false;
}
