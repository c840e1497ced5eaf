/**
 * @file newtons_cradle.hpp
 * @brief A row of touching balls struck end-on by one moving ball
 */

#pragma once

#include <entt/entt.hpp>
#include "elastic/core/i_scenario.hpp"

/**
 * @class NewtonsCradleScenario
 *
 * BallCount - 1 equal balls rest in contact along the box midline. A striker
 * of the same size approaches from the left; with equal masses its momentum
 * travels down the row and leaves with the last ball.
 */
class NewtonsCradleScenario : public IScenario {
public:
    explicit NewtonsCradleScenario(ScenarioConfig config = defaultConfig());
    ~NewtonsCradleScenario() override = default;

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

    static ScenarioConfig defaultConfig();

    static constexpr double BallRadius = 0.4;
    static constexpr double StrikerSpeed = 3.0;
    static constexpr double StrikerX = 1.5;
    static constexpr double RowStartX = 4.0;

private:
    ScenarioConfig scenarioConfig;
};
