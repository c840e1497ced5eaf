#include "elastic/scenarios/head_on.hpp"

#include <utility>

#include "elastic/core/constants.hpp"
#include "elastic/physics/body.hpp"
#include "elastic/systems/body_sync.hpp"

namespace {
    constexpr double BallRadius = 0.5;
    constexpr double BallSpeed = 1.0;
}

HeadOnScenario::HeadOnScenario(ScenarioConfig config)
    : scenarioConfig(std::move(config))
{
}

ScenarioConfig HeadOnScenario::defaultConfig() {
    ScenarioConfig cfg;
    cfg.DurationSeconds = 5.0;
    cfg.BallCount = 2;
    return cfg;
}

ScenarioConfig HeadOnScenario::getConfig() const {
    return scenarioConfig;
}

void HeadOnScenario::createEntities(entt::registry& registry) const {
    double const w = scenarioConfig.BoundaryWidth;
    double const midY = scenarioConfig.BoundaryHeight * 0.5;

    Physics::Body left(Position(w * 0.25, midY), Vector(BallSpeed, 0.0), BallRadius);
    Physics::Body right(Position(w * 0.75, midY), Vector(-BallSpeed, 0.0), BallRadius);

    Systems::BodySync::spawnBody(registry, left, 0, SimulatorConstants::paletteColor(0));
    Systems::BodySync::spawnBody(registry, right, 1, SimulatorConstants::paletteColor(1));
}
