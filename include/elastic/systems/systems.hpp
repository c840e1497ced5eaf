#pragma once

/**
 * @brief Defines available ECS systems for the simulation.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The ECS systems that can be activated in a scenario.
 */
enum class SystemType {
    ELASTIC_COLLISION,
    CONSERVATION_MONITOR,
};

} // namespace Systems
