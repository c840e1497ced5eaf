/**
 * @fileoverview simulator.cpp
 * @brief Implementation of ECSSimulator.
 */

#include "elastic/core/simulator.hpp"

#include <cmath>
#include <iostream>
#include <utility>

#include "elastic/core/debug.hpp"
#include "elastic/core/profile.hpp"
#include "elastic/systems/body_sync.hpp"
#include "elastic/systems/conservation_monitor.hpp"
#include "elastic/systems/elastic_collision.hpp"

ECSSimulator::ECSSimulator() = default;

ECSSimulator::~ECSSimulator() = default;

bool ECSSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  if (!scenario) {
    std::cerr << "ECSSimulator::loadScenario: no scenario given" << std::endl;
    return false;
  }

  ScenarioConfig const cfg = scenario->getConfig();
  if (auto err = validateScenarioConfig(cfg)) {
    std::cerr << "Invalid scenario configuration: " << *err << std::endl;
    return false;
  }

  scenarioPtr = std::move(scenario);
  return applyConfig(makeSystemConfig(cfg));
}

bool ECSSimulator::applyConfig(const SystemConfig& cfg) {
  if (auto err = validateSystemConfig(cfg)) {
    std::cerr << "Invalid system configuration: " << *err << std::endl;
    return false;
  }

  bool const systemsChanged = cfg.activeSystems != currentConfig.activeSystems;
  currentConfig = cfg;

  if (systemsChanged) {
    createSystems();
    return true;
  }

  // Update config for all existing systems
  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
  return true;
}

void ECSSimulator::reset() {
  registry.clear();

  auto stateEntity = registry.create();
  registry.emplace<Components::SimulatorState>(stateEntity);

  if (scenarioPtr) {
    scenarioPtr->createEntities(registry);
  }

  // Energy baseline is the state before the first step
  auto& state = registry.get<Components::SimulatorState>(stateEntity);
  state.initialKineticEnergy = Physics::totalKineticEnergy(bodies());
  state.kineticEnergy = state.initialKineticEnergy;
  state.energyBaselineSet = true;

  init();
}

void ECSSimulator::createSystems() {
  systems.clear();

  for (auto type : currentConfig.activeSystems) {
    switch (type) {
      case Systems::SystemType::ELASTIC_COLLISION:
        systems.push_back(std::make_unique<Systems::ElasticCollisionSystem>());
        break;
      case Systems::SystemType::CONSERVATION_MONITOR:
        systems.push_back(std::make_unique<Systems::ConservationMonitorSystem>());
        break;
    }
  }

  // Configure all systems
  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void ECSSimulator::init() {
  DEBUG_MSG(DEBUG_LEVEL_BASIC, "ECSSimulator::init()\n");

  createSystems();
}

void ECSSimulator::tick() {
  PROFILE_SCOPE("ECSSimulator::tick");

  // Update all systems in order
  for (auto& system : systems) {
    system->update(registry);
  }

  auto stateView = registry.view<Components::SimulatorState>();
  if (!stateView.empty()) {
    auto& state = registry.get<Components::SimulatorState>(stateView.front());
    ++state.frame;
    state.simulatedSeconds = static_cast<double>(state.frame) * currentConfig.SecondsPerFrame;
  }
}

std::uint64_t ECSSimulator::run(double duration, const FrameCallback& onFrame) {
  PROFILE_SCOPE("ECSSimulator::run");

  std::uint64_t const frames = frameCount(duration, currentConfig.SecondsPerFrame);
  for (std::uint64_t frame = 0; frame < frames; ++frame) {
    if (onFrame && !onFrame(*this, frame)) {
      return frame;
    }
    tick();
  }
  return frames;
}

std::vector<Position> ECSSimulator::snapshot() const {
  std::vector<Position> positions;
  for (auto entity : Systems::BodySync::orderedEntities(registry)) {
    positions.push_back(registry.get<Components::Position>(entity));
  }
  return positions;
}

std::vector<Physics::Body> ECSSimulator::bodies() const {
  return Systems::BodySync::gatherBodies(registry, Systems::BodySync::orderedEntities(registry));
}

Components::SimulatorState ECSSimulator::getState() const {
  auto stateView = registry.view<const Components::SimulatorState>();
  if (stateView.empty()) {
    return Components::SimulatorState();
  }
  return registry.get<Components::SimulatorState>(stateView.front());
}

void ECSSimulator::printState(std::ostream& out) const {
  auto const all = bodies();
  for (std::size_t i = 0; i < all.size(); ++i) {
    const auto& b = all[i];
    out << "Ball " << i + 1 << " position: [" << b.position.x << ", " << b.position.y << "]\n";
    out << "Ball " << i + 1 << " velocity: [" << b.velocity.x << ", " << b.velocity.y << "]\n";
    out << "Ball " << i + 1 << " radius: " << b.getRadius() << "\n";
    out << "Ball " << i + 1 << " mass: " << b.getMass() << "\n";
  }
}

std::uint64_t ECSSimulator::frameCount(double duration, double dt) {
  if (!(duration > 0.0) || !(dt > 0.0)) {
    return 0;
  }
  // 2^64: anything at or above it does not fit the counter
  double const frames = std::ceil(duration / dt);
  if (!std::isfinite(frames) || frames >= 18446744073709551616.0) {
    return 0;
  }
  return static_cast<std::uint64_t>(frames);
}
