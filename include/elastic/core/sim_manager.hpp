/**
 * @fileoverview sim_manager.hpp
 * @brief High-level controller for the interactive window.
 */

#pragma once

#include <SFML/Graphics/RenderWindow.hpp>

#include "elastic/core/cli.hpp"
#include "elastic/core/scenario_manager.hpp"
#include "elastic/core/simulator.hpp"
#include "elastic/rendering/renderer.hpp"

/**
 * @class SimManager
 * @brief Orchestrates the main loop, owns the window, and manages scenario selection.
 *
 * Keys: P pause, Space step one frame while paused, R reset,
 * 1-3 select a scenario, Esc quit.
 */
class SimManager {
 public:
  explicit SimManager(CommandLineOptions options);

  /**
   * @brief Loads the initial scenario and opens the window.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window closes or Esc is pressed.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the simulation (unless paused).
   */
  void tick();

  void render();

  void togglePause();
  void resetSimulator();
  void stepOnce();

  /**
   * @brief Switches to another scenario, keeping the command-line overrides.
   * @return false if the scenario could not be loaded; the old one keeps running.
   */
  bool selectScenario(SimulatorConstants::SimulationType scenario);

  bool isPaused() const { return paused; }
  const ECSSimulator& getSimulator() const { return simulator; }

 private:
  void openWindow();
  void updateTitle();

  CommandLineOptions options;
  ECSSimulator simulator;
  ScenarioManager scenarioManager;
  Renderer renderer;
  sf::RenderWindow window;

  bool running;
  bool paused;
  bool stepFrame;
};
