/**
 * @file head_on.hpp
 * @brief Two equal balls approaching each other along x
 */

#pragma once

#include <entt/entt.hpp>
#include "elastic/core/i_scenario.hpp"

/**
 * @class HeadOnScenario
 *
 * Equal balls (radius 0.5) start at x = 2.5 and x = 7.5 on the box midline
 * with speeds +1 and -1. They touch at t = 2 s and exchange velocities.
 */
class HeadOnScenario : public IScenario {
public:
    explicit HeadOnScenario(ScenarioConfig config = defaultConfig());
    ~HeadOnScenario() override = default;

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

    static ScenarioConfig defaultConfig();

private:
    ScenarioConfig scenarioConfig;
};
