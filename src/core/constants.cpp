#include "elastic/core/constants.hpp"

#include <algorithm>
#include <cctype>

#include "elastic/physics/body.hpp"

namespace SimulatorConstants {

    const double Pi = Physics::Pi;

    const double PixelsPerMeter   = 80.0;
    const double ViewMarginMeters = 0.5;

    Components::Color paletteColor(std::size_t index) {
        static const Components::Color palette[] = {
            {  0,   0, 255},  // blue
            {255,   0,   0},  // red
            {  0, 128,   0},  // green
            {255, 165,   0},  // orange
            {128,   0, 128},  // purple
            {  0, 255, 255},  // cyan
            {255,   0, 255},  // magenta
            {255, 255,   0},  // yellow
            {165,  42,  42},  // brown
            {255, 192, 203}   // pink
        };
        const std::size_t count = sizeof(palette) / sizeof(palette[0]);
        return palette[index % count];
    }

    std::vector<SimulationType> getAllScenarios() {
        return {
            SimulationType::RANDOM_BALLS,
            SimulationType::HEAD_ON,
            SimulationType::NEWTONS_CRADLE
        };
    }

    std::string getScenarioName(SimulationType scenario) {
        switch (scenario) {
            case SimulationType::RANDOM_BALLS:   return "RANDOM_BALLS";
            case SimulationType::HEAD_ON:        return "HEAD_ON";
            case SimulationType::NEWTONS_CRADLE: return "NEWTONS_CRADLE";
            default: return "UNKNOWN";
        }
    }

    std::optional<SimulationType> scenarioFromName(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        for (auto s : getAllScenarios()) {
            if (getScenarioName(s) == upper) {
                return s;
            }
        }
        return std::nullopt;
    }

} // namespace SimulatorConstants
