/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the simulation
 */

#pragma once

#include <entt/entt.hpp>
#include "elastic/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Systems are created by the simulator from SystemConfig::activeSystems and
 * updated once per macroscopic step, in creation order.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SystemConfig& config) = 0;
};

} // namespace Systems
