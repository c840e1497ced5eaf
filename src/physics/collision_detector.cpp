#include "elastic/physics/collision_detector.hpp"

#include <algorithm>
#include <cmath>

namespace Physics {

ContactInfo CollisionDetector::checkCollision(const Body& a, const Body& b) {
    Vector const diff = b.position - a.position;
    double const distance = diff.length();
    double const minDistance = a.getRadius() + b.getRadius();
    double const tolerance = minDistance * RelativeTolerance;

    ContactInfo info;
    if (!(distance < minDistance + tolerance)) {
        return info;
    }

    info.isColliding = true;
    info.overlap = std::max(minDistance - distance, 0.0);
    info.normal = diff.normalized(CoincidentDistance);
    return info;
}

ContactInfo CollisionDetector::checkBoundary(const Body& body, const Boundary& boundary) {
    double const r = body.getRadius();

    struct Wall {
        double penetration;
        Vector normal;
    };
    const Wall walls[] = {
        {r - body.position.x, Vector(-1.0, 0.0)},
        {body.position.x + r - boundary.getWidth(), Vector(1.0, 0.0)},
        {r - body.position.y, Vector(0.0, -1.0)},
        {body.position.y + r - boundary.getHeight(), Vector(0.0, 1.0)},
    };

    ContactInfo info;
    for (const auto& wall : walls) {
        if (wall.penetration > info.overlap) {
            info.isColliding = true;
            info.overlap = wall.penetration;
            info.normal = wall.normal;
        }
    }
    return info;
}

bool CollisionDetector::enforceBoundary(Body& body, const Boundary& boundary) {
    double const r = body.getRadius();
    bool hit = false;

    // x axis
    if (body.position.x - r < 0.0) {
        body.position.x = r;
        body.velocity.x = std::abs(body.velocity.x);
        hit = true;
    } else if (body.position.x + r > boundary.getWidth()) {
        body.position.x = boundary.getWidth() - r;
        body.velocity.x = -std::abs(body.velocity.x);
        hit = true;
    }

    // y axis
    if (body.position.y - r < 0.0) {
        body.position.y = r;
        body.velocity.y = std::abs(body.velocity.y);
        hit = true;
    } else if (body.position.y + r > boundary.getHeight()) {
        body.position.y = boundary.getHeight() - r;
        body.velocity.y = -std::abs(body.velocity.y);
        hit = true;
    }

    return hit;
}

} // namespace Physics
