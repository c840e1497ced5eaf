#include "elastic/physics/integrator.hpp"

#include "elastic/physics/collision_detector.hpp"
#include "elastic/physics/collision_resolver.hpp"

namespace Physics {

StepStats Integrator::step(std::vector<Body>& bodies,
                           const Boundary& boundary,
                           double dt,
                           const IntegratorConfig& config)
{
    StepStats stats;
    if (!(dt > 0.0) || config.substeps < 1) {
        return stats;
    }

    double const dtSub = dt / config.substeps;

    for (int s = 0; s < config.substeps; ++s) {
        for (auto& body : bodies) {
            body.position += body.velocity * dtSub;
            if (CollisionDetector::enforceBoundary(body, boundary)) {
                ++stats.wallContacts;
            }
        }

        stats.pairContacts += relax(bodies, config.relaxationPasses);
    }

    return stats;
}

std::size_t Integrator::relax(std::vector<Body>& bodies, int passes) {
    std::size_t contacts = 0;
    std::size_t const n = bodies.size();

    for (int pass = 0; pass < passes; ++pass) {
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                if (CollisionResolver::resolveCollision(bodies[i], bodies[j])) {
                    ++contacts;
                }
            }
        }
    }
    return contacts;
}

} // namespace Physics
