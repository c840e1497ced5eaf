#pragma once

#include <cstddef>
#include <cstdint>

namespace Components {
    /**
     * @brief Singleton-entity component holding run-wide counters
     */
    struct SimulatorState {
        std::uint64_t frame = 0;          ///< macroscopic steps taken
        double simulatedSeconds = 0.0;

        // Contact counters accumulated over the run
        std::size_t pairContacts = 0;
        std::size_t wallContacts = 0;

        // Conservation diagnostics
        bool energyBaselineSet = false;
        bool driftWarned = false;
        double initialKineticEnergy = 0.0;
        double kineticEnergy = 0.0;
        double maxRelativeEnergyDrift = 0.0;
    };
}
