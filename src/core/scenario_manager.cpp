/**
 * @fileoverview scenario_manager.cpp
 * @brief Implementation of ScenarioManager.
 */

#include <vector>

#include "elastic/core/scenario_manager.hpp"
#include "elastic/scenarios/head_on.hpp"
#include "elastic/scenarios/newtons_cradle.hpp"
#include "elastic/scenarios/random_balls.hpp"

void ScenarioManager::buildScenarioList() {
  scenarioList.clear();
  for (auto s : SimulatorConstants::getAllScenarios()) {
    scenarioList.emplace_back(s, SimulatorConstants::getScenarioName(s));
  }
}

const std::vector<std::pair<SimulatorConstants::SimulationType, std::string>>&
ScenarioManager::getScenarioList() const {
  return scenarioList;
}

void ScenarioManager::setInitialScenario(SimulatorConstants::SimulationType scenario) {
  currentScenario = scenario;
}

SimulatorConstants::SimulationType ScenarioManager::getCurrentScenario() const {
  return currentScenario;
}

ScenarioConfig ScenarioManager::defaultConfig(SimulatorConstants::SimulationType scenarioType) {
  switch (scenarioType) {
    case SimulatorConstants::SimulationType::HEAD_ON:
      return HeadOnScenario::defaultConfig();

    case SimulatorConstants::SimulationType::NEWTONS_CRADLE:
      return NewtonsCradleScenario::defaultConfig();

    case SimulatorConstants::SimulationType::RANDOM_BALLS:
    default:
      return RandomBallsScenario::defaultConfig();
  }
}

std::unique_ptr<IScenario> ScenarioManager::createScenario(
    SimulatorConstants::SimulationType scenarioType,
    const std::optional<ScenarioConfig>& config) const {
  ScenarioConfig const cfg = config ? *config : defaultConfig(scenarioType);

  switch (scenarioType) {
    case SimulatorConstants::SimulationType::HEAD_ON:
      return std::make_unique<HeadOnScenario>(cfg);

    case SimulatorConstants::SimulationType::NEWTONS_CRADLE:
      return std::make_unique<NewtonsCradleScenario>(cfg);

    case SimulatorConstants::SimulationType::RANDOM_BALLS:
    default:
      return std::make_unique<RandomBallsScenario>(cfg);
  }
}
