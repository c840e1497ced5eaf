#pragma once

#include <optional>
#include <string>
#include <vector>

#include "elastic/physics/body.hpp"
#include "elastic/physics/integrator.hpp"
#include "elastic/systems/systems.hpp"

/**
 * @struct SystemConfig
 * @brief Holds all runtime parameters handed to the ECS systems.
 */
struct SystemConfig {
    double BoundaryWidth = 10.0;
    double BoundaryHeight = 8.0;
    double SecondsPerFrame = 0.01;

    int Substeps = 400;
    int RelaxationPasses = 20;

    std::vector<Systems::SystemType> activeSystems;

    Physics::Boundary boundary() const;
    Physics::IntegratorConfig integratorConfig() const;
};

/**
 * @brief Checks a runtime configuration for values the kernel cannot use
 * @return A description of the first problem found, or nullopt if valid
 */
std::optional<std::string> validateSystemConfig(const SystemConfig& cfg);
