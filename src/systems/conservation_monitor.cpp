#include "elastic/systems/conservation_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "elastic/components/sim.hpp"
#include "elastic/core/debug.hpp"
#include "elastic/core/profile.hpp"
#include "elastic/systems/body_sync.hpp"

namespace Systems {

void ConservationMonitorSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("ConservationMonitorSystem");

    auto stateView = registry.view<Components::SimulatorState>();
    if (stateView.empty()) {
        return;
    }
    auto& state = registry.get<Components::SimulatorState>(stateView.front());

    auto bodies = BodySync::gatherBodies(registry, BodySync::orderedEntities(registry));
    const double energy = Physics::totalKineticEnergy(bodies);
    state.kineticEnergy = energy;

    if (!state.energyBaselineSet) {
        state.initialKineticEnergy = energy;
        state.energyBaselineSet = true;
        return;
    }

    // All bodies at rest: nothing to compare against
    if (state.initialKineticEnergy <= 0.0) {
        return;
    }

    const double drift = std::abs(energy - state.initialKineticEnergy) / state.initialKineticEnergy;
    state.maxRelativeEnergyDrift = std::max(state.maxRelativeEnergyDrift, drift);

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "ConservationMonitor: frame " << state.frame
              << " KE=" << energy << " drift=" << drift << "\n");

    if (drift > monitorConfig.driftWarningThreshold && !state.driftWarned) {
        std::cerr << "Warning: kinetic energy drifted by " << drift
                  << " (relative) at frame " << state.frame
                  << ", initial " << state.initialKineticEnergy
                  << ", now " << energy << std::endl;
        state.driftWarned = true;
    }
}

} // namespace Systems
