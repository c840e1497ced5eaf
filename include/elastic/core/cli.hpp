/**
 * @file cli.hpp
 * @brief Command-line options of the elastic_sim executable
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "elastic/core/constants.hpp"
#include "elastic/core/scenario_config.hpp"

/**
 * @struct CommandLineOptions
 * @brief Parsed flags; unset optionals keep the scenario's defaults
 */
struct CommandLineOptions {
    SimulatorConstants::SimulationType scenario = SimulatorConstants::SimulationType::RANDOM_BALLS;

    std::optional<double> duration;
    std::optional<double> dt;
    std::optional<int> balls;
    std::optional<std::uint32_t> seed;
    std::optional<int> substeps;
    std::optional<int> passes;

    std::string recordDir;   ///< empty: no recording
    bool headless = false;
    bool profile = false;
    bool help = false;
};

/**
 * @brief Parses the arguments following the program name
 * @param args Arguments, without argv[0]
 * @param err Receives a description of the first bad argument
 * @return Parsed options, or nullopt on any invalid argument
 */
std::optional<CommandLineOptions> parseCommandLine(const std::vector<std::string>& args,
                                                   std::ostream& err);

/**
 * @brief Replaces scenario defaults with the flags that were given
 */
ScenarioConfig applyOverrides(ScenarioConfig cfg, const CommandLineOptions& options);

void printUsage(std::ostream& out, const std::string& program);
