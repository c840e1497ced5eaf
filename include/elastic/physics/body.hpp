/**
 * @file body.hpp
 * @brief Circular rigid bodies and the rectangular domain that contains them
 *
 * Bodies are unit-density disks: mass is always derived from the radius when
 * a body is built from (position, velocity, radius). Radius and mass never
 * change afterwards; position and velocity are rewritten every sub-step.
 *
 * Callers must pass radius > 0 and a boundary with positive width/height.
 * Degenerate values are not rejected and lead to degenerate numerics.
 */

#pragma once

#include <vector>

#include "elastic/math/vector_math.hpp"

namespace Physics {

constexpr double Pi = 3.14159265358979323846;

/**
 * @class Body
 * @brief A disk with mutable kinematic state and immutable size and mass
 */
class Body {
public:
    Position position;  ///< Centre of the disk
    Vector velocity;    ///< Linear velocity

    /**
     * @brief Builds a body and derives mass = Pi * radius^2
     */
    Body(const Position& position, const Vector& velocity, double radius);

    /**
     * @brief Rebuilds a body whose mass is already known
     *
     * Used when restoring a body from stored components.
     */
    Body(const Position& position, const Vector& velocity, double radius, double mass);

    double getRadius() const { return radius; }
    double getMass() const { return mass; }

    /** @brief Unit-density disk mass for the given radius */
    static double massForRadius(double radius);

private:
    double radius;
    double mass;
};

/**
 * @class Boundary
 * @brief Axis-aligned box [0,width] x [0,height], fixed for a simulation
 */
class Boundary {
public:
    Boundary(double width, double height);

    double getWidth() const { return width; }
    double getHeight() const { return height; }

private:
    double width;
    double height;
};

/** @brief Kinetic energy 1/2 m |v|^2 of a single body */
double kineticEnergy(const Body& body);

/** @brief Sum of kinetic energies over the collection */
double totalKineticEnergy(const std::vector<Body>& bodies);

/** @brief Sum of m v over the collection */
Vector totalMomentum(const std::vector<Body>& bodies);

} // namespace Physics
