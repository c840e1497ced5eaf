#include "elastic/physics/time_to_contact.hpp"

#include <cmath>

namespace Physics {

double TimeToContact::predict(const Body& a, const Body& b) {
    Vector const dr = a.position - b.position;
    Vector const dv = a.velocity - b.velocity;
    double const rSum = a.getRadius() + b.getRadius();

    double const qa = dv.dotProduct(dv);
    double const qb = 2.0 * dr.dotProduct(dv);
    double const qc = dr.dotProduct(dr) - rSum * rSum;

    double const discriminant = qb * qb - 4.0 * qa * qc;
    if (discriminant < 0.0 || qa < MinRelativeSpeedSquared) {
        return Never;
    }

    double const root = std::sqrt(discriminant);
    double const t1 = (-qb - root) / (2.0 * qa);
    double const t2 = (-qb + root) / (2.0 * qa);

    if (t1 > 0.0) {
        return t1;
    }
    if (t2 > 0.0) {
        return t2;
    }
    return Never;
}

bool TimeToContact::willCollide(double t) {
    return std::isfinite(t);
}

} // namespace Physics
