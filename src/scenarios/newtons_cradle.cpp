#include "elastic/scenarios/newtons_cradle.hpp"

#include <utility>

#include "elastic/core/constants.hpp"
#include "elastic/physics/body.hpp"
#include "elastic/systems/body_sync.hpp"

NewtonsCradleScenario::NewtonsCradleScenario(ScenarioConfig config)
    : scenarioConfig(std::move(config))
{
}

ScenarioConfig NewtonsCradleScenario::defaultConfig() {
    ScenarioConfig cfg;
    cfg.DurationSeconds = 6.0;
    cfg.BallCount = 6;
    return cfg;
}

ScenarioConfig NewtonsCradleScenario::getConfig() const {
    return scenarioConfig;
}

void NewtonsCradleScenario::createEntities(entt::registry& registry) const {
    double const midY = scenarioConfig.BoundaryHeight * 0.5;

    if (scenarioConfig.BallCount < 1) {
        return;
    }

    Physics::Body striker(Position(StrikerX, midY), Vector(StrikerSpeed, 0.0), BallRadius);
    Systems::BodySync::spawnBody(registry, striker, 0, SimulatorConstants::paletteColor(0));

    // Row balls touch exactly; the row has to fit inside the box
    for (int i = 1; i < scenarioConfig.BallCount; ++i) {
        double const x = RowStartX + 2.0 * BallRadius * (i - 1);
        if (x + BallRadius > scenarioConfig.BoundaryWidth) {
            break;
        }
        Physics::Body ball(Position(x, midY), Vector(0.0, 0.0), BallRadius);
        auto const index = static_cast<std::size_t>(i);
        Systems::BodySync::spawnBody(registry, ball, index, SimulatorConstants::paletteColor(index));
    }
}
