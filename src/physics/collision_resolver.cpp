#include "elastic/physics/collision_resolver.hpp"

#include <cmath>

#include "elastic/physics/collision_detector.hpp"

namespace Physics {

bool CollisionResolver::resolveCollision(Body& a, Body& b) {
    ContactInfo const contact = CollisionDetector::checkCollision(a, b);
    if (!contact.isColliding) {
        return false;
    }

    double const massA = a.getMass();
    double const massB = b.getMass();
    double const totalMass = massA + massB;
    if (!(totalMass > 0.0) || !std::isfinite(totalMass)) {
        return false;
    }

    const Vector& n = contact.normal;

    // Penetration: heavier body moves less
    double const shiftA = (massB / totalMass) * contact.overlap * PositionCorrectionFactor;
    double const shiftB = (massA / totalMass) * contact.overlap * PositionCorrectionFactor;
    a.position -= n * shiftA;
    b.position += n * shiftB;

    // Normal speed of B relative to A; negative while closing
    Vector const relativeVel = b.velocity - a.velocity;
    double const normalSpeed = relativeVel.dotProduct(n);

    if (normalSpeed < 0.0) {
        double const j = -(1.0 + Restitution) * normalSpeed;
        a.velocity -= n * (j * massB / totalMass);
        b.velocity += n * (j * massA / totalMass);
    }

    return true;
}

} // namespace Physics
