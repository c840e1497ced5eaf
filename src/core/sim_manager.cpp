/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which drives the interactive window.
 */

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

#include <SFML/Window/Event.hpp>

#include "elastic/core/constants.hpp"
#include "elastic/core/profile.hpp"
#include "elastic/core/sim_manager.hpp"

namespace {
    constexpr unsigned int MaxFramerate = 240;
}

SimManager::SimManager(CommandLineOptions options)
    : options(std::move(options))
    , simulator()
    , scenarioManager()
    , renderer(Simulation::Viewport(SystemConfig()))
    , window()
    , running(true)
    , paused(false)
    , stepFrame(false)
{
}

bool SimManager::init()
{
    scenarioManager.buildScenarioList();
    scenarioManager.setInitialScenario(options.scenario);

    if (!selectScenario(scenarioManager.getCurrentScenario()))
    {
        std::cerr << "Failed to load scenario "
                  << SimulatorConstants::getScenarioName(options.scenario) << std::endl;
        return false;
    }

    if (!window.isOpen())
    {
        std::cerr << "Failed to open window." << std::endl;
        return false;
    }
    return true;
}

void SimManager::openWindow()
{
    const auto& viewport = renderer.getViewport();
    unsigned int const width = viewport.widthPixels();
    unsigned int const height = viewport.heightPixels();

    if (!window.isOpen() || window.getSize() != sf::Vector2u(width, height))
    {
        window.create(sf::VideoMode(width, height), "Elastic Collision Simulator",
                      sf::Style::Titlebar | sf::Style::Close);
    }

    // One frame of simulated time per displayed frame
    double const fps = 1.0 / simulator.getConfig().SecondsPerFrame;
    window.setFramerateLimit(static_cast<unsigned int>(
        std::lround(std::min(fps, static_cast<double>(MaxFramerate)))));
}

void SimManager::updateTitle()
{
    auto const state = simulator.getState();
    std::ostringstream title;
    title << SimulatorConstants::getScenarioName(scenarioManager.getCurrentScenario())
          << "  t=" << state.simulatedSeconds << "s"
          << (paused ? "  [paused]" : "");
    window.setTitle(title.str());
}

void SimManager::run()
{
    while (running && window.isOpen())
    {
        if (!handleEvents())
        {
            break;
        }
        tick();
        render();
    }
    window.close();
}

bool SimManager::handleEvents()
{
    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::P:
                    togglePause();
                    break;
                case sf::Keyboard::Space: // Advance one frame if paused
                    if (paused)
                    {
                        stepOnce();
                    }
                    break;
                case sf::Keyboard::R:
                    resetSimulator();
                    break;
                case sf::Keyboard::Num1:
                    selectScenario(SimulatorConstants::SimulationType::RANDOM_BALLS);
                    break;
                case sf::Keyboard::Num2:
                    selectScenario(SimulatorConstants::SimulationType::HEAD_ON);
                    break;
                case sf::Keyboard::Num3:
                    selectScenario(SimulatorConstants::SimulationType::NEWTONS_CRADLE);
                    break;
                default:
                    break;
            }
        }
    }
    return running;
}

void SimManager::tick()
{
    if (!paused || stepFrame)
    {
        simulator.tick();
        stepFrame = false;
    }
}

void SimManager::render()
{
    PROFILE_SCOPE("SimManager::render");

    renderer.renderScene(window, simulator.getRegistry());
    updateTitle();
    window.display();
}

void SimManager::togglePause()
{
    paused = !paused;
}

void SimManager::resetSimulator()
{
    simulator.reset();
    paused = false;
}

void SimManager::stepOnce()
{
    stepFrame = true;
}

bool SimManager::selectScenario(SimulatorConstants::SimulationType scenario)
{
    std::cerr << "Creating " << SimulatorConstants::getScenarioName(scenario)
              << " scenario..." << std::endl;

    ScenarioConfig const cfg = applyOverrides(ScenarioManager::defaultConfig(scenario), options);
    if (!simulator.loadScenario(scenarioManager.createScenario(scenario, cfg)))
    {
        return false;
    }

    scenarioManager.setInitialScenario(scenario);
    simulator.reset();
    renderer.setViewport(Simulation::Viewport(simulator.getConfig()));
    openWindow();

    paused = false;
    return true;
}
