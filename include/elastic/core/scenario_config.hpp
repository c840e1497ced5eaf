/**
 * @file scenario_config.hpp
 * @brief Configuration for a simulation scenario.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "elastic/core/system_config.hpp"
#include "elastic/systems/systems.hpp"

/**
 * @brief Everything a scenario needs to set up and run.
 *
 * Holds the domain size, timing, kernel iteration counts and the parameters
 * of the body generator. The body generator fields are only read by
 * scenarios that generate bodies procedurally.
 */
struct ScenarioConfig {
    double BoundaryWidth = 10.0;
    double BoundaryHeight = 8.0;
    double SecondsPerFrame = 0.01;
    double DurationSeconds = 10.0;

    int Substeps = 400;
    int RelaxationPasses = 20;

    int BallCount = 10;
    double RadiusMin = 0.2;
    double RadiusMax = 0.6;
    double SpeedMin = 2.0;
    double SpeedMax = 4.0;
    int PlacementAttempts = 100;
    std::uint32_t Seed = 42;

    // Active ECS systems for this scenario.
    std::vector<Systems::SystemType> activeSystems = {
        Systems::SystemType::ELASTIC_COLLISION,
        Systems::SystemType::CONSERVATION_MONITOR
    };
};

/// Largest number of frames a single run may take
constexpr double MaxFramesPerRun = 1e12;

/**
 * @brief Extracts the runtime parameters handed to the ECS systems.
 */
SystemConfig makeSystemConfig(const ScenarioConfig& cfg);

/**
 * @brief Checks the scenario parameters, including the derived SystemConfig
 * @return A description of the first problem found, or nullopt if valid
 */
std::optional<std::string> validateScenarioConfig(const ScenarioConfig& cfg);
