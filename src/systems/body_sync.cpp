#include "elastic/systems/body_sync.hpp"

#include <algorithm>

namespace Systems {
namespace BodySync {

std::vector<entt::entity> orderedEntities(const entt::registry& registry) {
    std::vector<entt::entity> entities;
    auto view = registry.view<const Components::BodyIndex>();
    for (auto entity : view) {
        entities.push_back(entity);
    }

    std::sort(entities.begin(), entities.end(),
              [&registry](entt::entity a, entt::entity b) {
                  return registry.get<Components::BodyIndex>(a).value
                       < registry.get<Components::BodyIndex>(b).value;
              });
    return entities;
}

std::vector<Physics::Body> gatherBodies(const entt::registry& registry,
                                        const std::vector<entt::entity>& entities) {
    std::vector<Physics::Body> bodies;
    bodies.reserve(entities.size());

    for (auto entity : entities) {
        const auto& pos    = registry.get<Components::Position>(entity);
        const auto& vel    = registry.get<Components::Velocity>(entity);
        const auto& radius = registry.get<Components::Radius>(entity);
        const auto& mass   = registry.get<Components::Mass>(entity);
        bodies.emplace_back(pos, vel, radius.value, mass.value);
    }
    return bodies;
}

void scatterBodies(entt::registry& registry,
                   const std::vector<entt::entity>& entities,
                   const std::vector<Physics::Body>& bodies) {
    const std::size_t n = std::min(entities.size(), bodies.size());
    for (std::size_t i = 0; i < n; ++i) {
        registry.replace<Components::Position>(entities[i], bodies[i].position);
        registry.replace<Components::Velocity>(entities[i], bodies[i].velocity);
    }
}

entt::entity spawnBody(entt::registry& registry,
                       const Physics::Body& body,
                       std::size_t index,
                       const Components::Color& color) {
    auto e = registry.create();
    registry.emplace<Components::Position>(e, body.position);
    registry.emplace<Components::Velocity>(e, body.velocity);
    registry.emplace<Components::Radius>(e, body.getRadius());
    registry.emplace<Components::Mass>(e, body.getMass());
    registry.emplace<Components::BodyIndex>(e, index);
    registry.emplace<Components::Color>(e, color);
    return e;
}

} // namespace BodySync
} // namespace Systems
