/**
 * @file body_sync.hpp
 * @brief Moves body state between the registry and the physics kernel
 *
 * The kernel works on an index-ordered std::vector<Physics::Body>. Entities
 * carry a BodyIndex so the order survives registry storage reshuffles.
 *
 * Required components per body:
 * - Position, Velocity, Radius, Mass, BodyIndex
 */

#pragma once

#include <vector>
#include <entt/entt.hpp>

#include "elastic/components/basic.hpp"
#include "elastic/physics/body.hpp"

namespace Systems {
namespace BodySync {

    /**
     * @brief Body entities sorted by BodyIndex
     */
    std::vector<entt::entity> orderedEntities(const entt::registry& registry);

    /**
     * @brief Builds kernel bodies in the order given by @p entities
     */
    std::vector<Physics::Body> gatherBodies(const entt::registry& registry,
                                            const std::vector<entt::entity>& entities);

    /**
     * @brief Writes positions and velocities back; sizes must match
     */
    void scatterBodies(entt::registry& registry,
                       const std::vector<entt::entity>& entities,
                       const std::vector<Physics::Body>& bodies);

    /**
     * @brief Creates a body entity with all required components
     */
    entt::entity spawnBody(entt::registry& registry,
                           const Physics::Body& body,
                           std::size_t index,
                           const Components::Color& color);

} // namespace BodySync
} // namespace Systems
