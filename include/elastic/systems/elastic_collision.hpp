/**
 * @file elastic_collision.hpp
 * @brief System advancing all bodies by one macroscopic step
 *
 * This system handles:
 * - Drift, wall reflection and pairwise elastic contacts via Physics::Integrator
 * - Accumulating contact counters in SimulatorState
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Radius, Mass, BodyIndex (to read)
 */

#pragma once

#include <entt/entt.hpp>

#include "elastic/core/system_config.hpp"
#include "elastic/systems/i_system.hpp"

namespace Systems {

class ElasticCollisionSystem : public ISystem {
public:
    ElasticCollisionSystem() = default;
    ~ElasticCollisionSystem() override = default;

    void update(entt::registry& registry) override;

    void setSystemConfig(const SystemConfig& config) override { sysConfig = config; }

private:
    SystemConfig sysConfig;
};

} // namespace Systems
