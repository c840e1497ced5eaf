/**
 * @file collision_detector.hpp
 * @brief Disk-disk and disk-wall contact queries
 */

#pragma once

#include "elastic/math/vector_math.hpp"
#include "elastic/physics/body.hpp"

namespace Physics {

/**
 * @struct ContactInfo
 * @brief Result of a contact query
 *
 * When isColliding is false, overlap is 0 and normal is the zero vector.
 * Otherwise normal is a unit vector pointing from the first body towards
 * the second one (or towards the penetrated wall).
 */
struct ContactInfo {
    bool isColliding = false;
    double overlap = 0.0;
    Vector normal;
};

/**
 * @class CollisionDetector
 * @brief Narrow-phase tests for disks inside a rectangular boundary
 */
class CollisionDetector {
public:
    /// Slack added to the sum of radii, relative to that sum.
    static constexpr double RelativeTolerance = 1e-8;

    /// Centres closer than this use the fixed (1,0) normal.
    static constexpr double CoincidentDistance = 1e-10;

    /**
     * @brief Tests two disks for contact
     *
     * Touching disks (within the relative tolerance) count as colliding and
     * report a zero overlap.
     */
    static ContactInfo checkCollision(const Body& a, const Body& b);

    /**
     * @brief Reports the deepest wall penetration of a disk
     *
     * Does not modify the body. The normal is the boundary's outward normal
     * at the penetrated wall.
     */
    static ContactInfo checkBoundary(const Body& body, const Boundary& boundary);

    /**
     * @brief Clamps a disk into the boundary and reflects its velocity
     *
     * Each axis is handled independently. A wall hit puts the disk back in
     * contact with the wall and points that velocity component inwards with
     * its magnitude unchanged.
     *
     * @return true if any wall was hit
     */
    static bool enforceBoundary(Body& body, const Boundary& boundary);
};

} // namespace Physics
