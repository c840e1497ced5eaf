#include "elastic/systems/elastic_collision.hpp"

#include "elastic/components/sim.hpp"
#include "elastic/core/debug.hpp"
#include "elastic/core/profile.hpp"
#include "elastic/physics/integrator.hpp"
#include "elastic/systems/body_sync.hpp"

namespace Systems {

void ElasticCollisionSystem::update(entt::registry& registry) {
    PROFILE_SCOPE("ElasticCollisionSystem");

    auto entities = BodySync::orderedEntities(registry);
    auto bodies = BodySync::gatherBodies(registry, entities);

    Physics::StepStats stats;
    {
        PROFILE_SCOPE("Integrator::step");
        stats = Physics::Integrator::step(bodies,
                                          sysConfig.boundary(),
                                          sysConfig.SecondsPerFrame,
                                          sysConfig.integratorConfig());
    }

    BodySync::scatterBodies(registry, entities, bodies);

    auto stateView = registry.view<Components::SimulatorState>();
    if (!stateView.empty()) {
        auto& state = registry.get<Components::SimulatorState>(stateView.front());
        state.pairContacts += stats.pairContacts;
        state.wallContacts += stats.wallContacts;
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "ElasticCollisionSystem: " << bodies.size()
              << " bodies, " << stats.pairContacts << " pair contacts, "
              << stats.wallContacts << " wall contacts\n");
}

} // namespace Systems
