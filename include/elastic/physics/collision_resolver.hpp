/**
 * @file collision_resolver.hpp
 * @brief Elastic impulse exchange between two overlapping disks
 */

#pragma once

#include "elastic/physics/body.hpp"

namespace Physics {

/**
 * @class CollisionResolver
 * @brief Separates an overlapping pair and exchanges a perfectly elastic impulse
 *
 * Position correction splits the overlap inversely to mass and over-corrects
 * by PositionCorrectionFactor so that repeated relaxation passes do not leave
 * residual penetration behind. The impulse is only applied while the pair is
 * approaching along the contact normal, so resolving an already separating
 * contact twice changes nothing further in velocity.
 */
class CollisionResolver {
public:
    static constexpr double PositionCorrectionFactor = 1.1;
    static constexpr double Restitution = 1.0;

    /**
     * @brief Resolves the contact between @p a and @p b, if any
     *
     * Non-colliding pairs, and pairs whose total mass is not a positive
     * finite number, are left untouched.
     *
     * @return true if the pair was in contact
     */
    static bool resolveCollision(Body& a, Body& b);
};

} // namespace Physics
