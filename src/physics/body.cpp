#include "elastic/physics/body.hpp"

namespace Physics {

Body::Body(const Position& position, const Vector& velocity, double radius)
    : position(position)
    , velocity(velocity)
    , radius(radius)
    , mass(massForRadius(radius))
{
}

Body::Body(const Position& position, const Vector& velocity, double radius, double mass)
    : position(position)
    , velocity(velocity)
    , radius(radius)
    , mass(mass)
{
}

double Body::massForRadius(double radius) {
    return Pi * radius * radius;
}

Boundary::Boundary(double width, double height)
    : width(width)
    , height(height)
{
}

double kineticEnergy(const Body& body) {
    return 0.5 * body.getMass() * body.velocity.lengthSquared();
}

double totalKineticEnergy(const std::vector<Body>& bodies) {
    double energy = 0.0;
    for (const auto& body : bodies) {
        energy += kineticEnergy(body);
    }
    return energy;
}

Vector totalMomentum(const std::vector<Body>& bodies) {
    Vector momentum;
    for (const auto& body : bodies) {
        momentum += body.velocity * body.getMass();
    }
    return momentum;
}

} // namespace Physics
