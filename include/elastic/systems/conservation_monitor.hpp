/**
 * @file conservation_monitor.hpp
 * @brief Tracks kinetic energy drift over a run
 *
 * The baseline is the energy stored in SimulatorState at reset; without one
 * the first update records it. Each update stores the current energy and
 * the largest relative drift seen in SimulatorState. Drift above
 * the warning threshold is reported once on stderr.
 */

#pragma once

#include <entt/entt.hpp>

#include "elastic/core/system_config.hpp"
#include "elastic/systems/i_system.hpp"

namespace Systems {

struct ConservationMonitorConfig {
    double driftWarningThreshold = 1e-6;
};

class ConservationMonitorSystem : public ISystem {
public:
    ConservationMonitorSystem() = default;
    ~ConservationMonitorSystem() override = default;

    void update(entt::registry& registry) override;

    void setSystemConfig(const SystemConfig& config) override { sysConfig = config; }
    void setMonitorConfig(const ConservationMonitorConfig& config) { monitorConfig = config; }

private:
    SystemConfig sysConfig;
    ConservationMonitorConfig monitorConfig;
};

} // namespace Systems
