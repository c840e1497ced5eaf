#ifndef ELASTIC_I_SCENARIO_HPP
#define ELASTIC_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "elastic/core/scenario_config.hpp"

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning ScenarioConfig
 *  - createEntities() that spawns all body entities, in input order
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns scenario configuration (boundary, timing, generator settings)
     */
    virtual ScenarioConfig getConfig() const = 0;

    /**
     * @brief Creates scenario-specific entities in the registry
     */
    virtual void createEntities(entt::registry &registry) const = 0;
};

#endif // ELASTIC_I_SCENARIO_HPP
