#ifndef ELASTIC_SIMULATOR_CONSTANTS_HPP
#define ELASTIC_SIMULATOR_CONSTANTS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "elastic/components/basic.hpp"

namespace SimulatorConstants {

    /**
     * @brief The high-level simulation scenario types.
     */
    enum class SimulationType {
        RANDOM_BALLS,
        HEAD_ON,
        NEWTONS_CRADLE
    };

    extern const double Pi;

    // Display
    extern const double PixelsPerMeter;   ///< 800 px across a 10 m box
    extern const double ViewMarginMeters; ///< blank border drawn around the boundary

    /**
     * @brief Ball colour for the given body index; cycles through ten colours
     */
    Components::Color paletteColor(std::size_t index);

    std::vector<SimulationType> getAllScenarios();
    std::string getScenarioName(SimulationType scenario);

    /**
     * @brief Looks a scenario up by name, ignoring case
     */
    std::optional<SimulationType> scenarioFromName(const std::string& name);
}

#endif // ELASTIC_SIMULATOR_CONSTANTS_HPP
