/**
 * @file time_to_contact.hpp
 * @brief Analytic prediction of the next contact instant of two disks
 *
 * Assumes both disks keep their current velocities. This is a standalone
 * query: the sub-stepped Integrator does not use it.
 */

#pragma once

#include <limits>

#include "elastic/physics/body.hpp"

namespace Physics {

class TimeToContact {
public:
    /// Returned when the disks never touch in the future.
    static constexpr double Never = std::numeric_limits<double>::infinity();

    /// Relative speeds (squared) below this count as no relative motion.
    static constexpr double MinRelativeSpeedSquared = 1e-20;

    /**
     * @brief Smallest positive t with |dr + t dv| = rA + rB
     *
     * dr = posA - posB, dv = velA - velB. Returns Never when the
     * discriminant is negative, the relative velocity vanishes, or both
     * roots lie in the past. Disks that already overlap report the time at
     * which they would separate.
     */
    static double predict(const Body& a, const Body& b);

    /** @brief true unless @p t is the Never sentinel */
    static bool willCollide(double t);
};

} // namespace Physics
