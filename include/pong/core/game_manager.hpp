/**
 * @fileoverview game_manager.hpp
 * @brief High-level controller for the match: owns the main loop, input,
 *        simulation stepping and presentation.
 */

#pragma once

#include <SFML/System/Clock.hpp>
#include <SFML/System/Time.hpp>
#include <SFML/Window/Event.hpp>

#include "pong/audio/sound_board.hpp"
#include "pong/core/constants.hpp"
#include "pong/core/simulator.hpp"
#include "pong/input/input_bindings.hpp"
#include "pong/rendering/presentation_manager.hpp"

/**
 * @class GameManager
 * @brief Orchestrates the fixed-rate main loop. Implemented as a Singleton.
 */
class GameManager {
 public:
  GameManager(const GameManager&) = delete;
  GameManager& operator=(const GameManager&) = delete;
  GameManager(GameManager&&) = delete;
  GameManager& operator=(GameManager&&) = delete;

  /** @brief Get the singleton instance. */
  static GameManager& getInstance();

  /**
   * @brief Opens the window and loads assets.
   * @return true on success, false otherwise.
   */
  bool init();

  /** @brief Runs until the window is closed or Escape is pressed. */
  void run();

  /** @brief Toggles the simulation pause state. */
  void togglePause();

  /** @brief Restarts the match at 0:0 and unpauses. */
  void resetMatch();

 private:
  GameManager();
  ~GameManager() = default;

  void handleEvents();
  void handleKeyPressed(sf::Keyboard::Key key);
  void tick();
  void render();

  PongSimulator simulator;
  PresentationManager presentation;
  InputBindings bindings;
  SoundBoard sounds;

  bool running;
  bool paused;

  // Fixed simulation step, from the scenario's GameConfig
  const sf::Time tickInterval;
  // Caps catch-up work after a stall (window drag, breakpoint)
  const sf::Time maxFrameTime = sf::seconds(0.25f);

  sf::Time timeSinceLastProfilerPrint;
  const sf::Time profilerPrintInterval = sf::seconds(PongConstants::ProfilerPrintIntervalSeconds);
};
