#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "elastic/physics/collision_detector.hpp"
#include "elastic/physics/integrator.hpp"

using namespace Physics;

class IntegratorTest : public ::testing::Test {
protected:
    Boundary box{10.0, 8.0};

    // A loose grid of disks with assorted velocities, none overlapping
    std::vector<Body> makeGrid() const {
        std::vector<Body> bodies;
        const double radii[] = {0.3, 0.5, 0.4, 0.25, 0.45, 0.35, 0.5, 0.3};
        for (int i = 0; i < 8; ++i) {
            double x = 1.5 + (i % 4) * 2.2;
            double y = 2.0 + (i / 4) * 3.5;
            double vx = std::cos(0.9 * i) * (2.0 + 0.25 * i);
            double vy = std::sin(0.9 * i) * (2.0 + 0.25 * i);
            bodies.emplace_back(Position(x, y), Vector(vx, vy), radii[i]);
        }
        return bodies;
    }
};

TEST_F(IntegratorTest, WallBounceFromCorner) {
    std::vector<Body> balls = {Body(Position(0.3, 0.3), Vector(-1.0, -1.0), 0.5)};

    Integrator::step(balls, box, 0.1);

    EXPECT_GE(balls[0].position.x, balls[0].getRadius());
    EXPECT_GE(balls[0].position.y, balls[0].getRadius());
    EXPECT_GT(balls[0].velocity.x, 0.0);
    EXPECT_GT(balls[0].velocity.y, 0.0);
    EXPECT_DOUBLE_EQ(balls[0].velocity.x, 1.0);
    EXPECT_DOUBLE_EQ(balls[0].velocity.y, 1.0);
}

TEST_F(IntegratorTest, FreeFlightIsLinear) {
    std::vector<Body> balls = {Body(Position(2.0, 3.0), Vector(1.5, -0.5), 0.5)};

    StepStats stats = Integrator::step(balls, box, 1.0);

    EXPECT_NEAR(balls[0].position.x, 3.5, 1e-12);
    EXPECT_NEAR(balls[0].position.y, 2.5, 1e-12);
    EXPECT_EQ(stats.pairContacts, 0u);
    EXPECT_EQ(stats.wallContacts, 0u);
}

TEST_F(IntegratorTest, HeadOnEqualMassesSwapVelocities) {
    std::vector<Body> balls = {
        Body(Position(3.0, 4.0), Vector(1.0, 0.0), 0.5),
        Body(Position(6.0, 4.0), Vector(-1.0, 0.0), 0.5),
    };

    StepStats first = Integrator::step(balls, box, 1.0);
    StepStats second = Integrator::step(balls, box, 1.0);

    EXPECT_GT(first.pairContacts + second.pairContacts, 0u);
    EXPECT_NEAR(balls[0].velocity.x, -1.0, 1e-9);
    EXPECT_NEAR(balls[1].velocity.x, 1.0, 1e-9);
    EXPECT_NEAR(balls[0].velocity.y, 0.0, 1e-12);
    EXPECT_NEAR(balls[1].velocity.y, 0.0, 1e-12);
    EXPECT_LT(balls[0].position.x, balls[1].position.x);
    EXPECT_NEAR(balls[0].position.x + balls[1].position.x, 9.0, 1e-9);
}

TEST_F(IntegratorTest, MomentumConservedAwayFromWalls) {
    Boundary huge(1000.0, 1000.0);
    std::vector<Body> balls = {
        Body(Position(500.0, 500.0), Vector(2.0, 0.3), 0.6),
        Body(Position(501.5, 500.2), Vector(-1.0, 0.0), 0.3),
        Body(Position(500.8, 501.4), Vector(0.0, -1.5), 0.4),
    };
    const Vector p0 = totalMomentum(balls);

    for (int i = 0; i < 10; ++i) {
        Integrator::step(balls, huge, 0.05);
    }

    const Vector p1 = totalMomentum(balls);
    EXPECT_NEAR(p1.x, p0.x, 1e-10);
    EXPECT_NEAR(p1.y, p0.y, 1e-10);
}

TEST_F(IntegratorTest, KineticEnergyConservedWithWallsAndContacts) {
    std::vector<Body> bodies = makeGrid();
    const double e0 = totalKineticEnergy(bodies);

    StepStats total;
    for (int i = 0; i < 50; ++i) {
        StepStats s = Integrator::step(bodies, box, 0.02);
        total.pairContacts += s.pairContacts;
        total.wallContacts += s.wallContacts;
    }

    EXPECT_GT(total.wallContacts, 0u);
    EXPECT_NEAR(totalKineticEnergy(bodies), e0, 1e-9 * e0);

    for (const auto& b : bodies) {
        const double r = b.getRadius();
        EXPECT_GE(b.position.x, r - 1e-2);
        EXPECT_LE(b.position.x, box.getWidth() - r + 1e-2);
        EXPECT_GE(b.position.y, r - 1e-2);
        EXPECT_LE(b.position.y, box.getHeight() - r + 1e-2);
    }
}

TEST_F(IntegratorTest, StepIsDeterministic) {
    std::vector<Body> run1 = makeGrid();
    std::vector<Body> run2 = makeGrid();

    for (int i = 0; i < 5; ++i) {
        Integrator::step(run1, box, 0.05);
        Integrator::step(run2, box, 0.05);
    }

    ASSERT_EQ(run1.size(), run2.size());
    for (std::size_t i = 0; i < run1.size(); ++i) {
        EXPECT_EQ(run1[i].position.x, run2[i].position.x);
        EXPECT_EQ(run1[i].position.y, run2[i].position.y);
        EXPECT_EQ(run1[i].velocity.x, run2[i].velocity.x);
        EXPECT_EQ(run1[i].velocity.y, run2[i].velocity.y);
    }
}

TEST_F(IntegratorTest, DegenerateStepLeavesStateUntouched) {
    std::vector<Body> balls = {Body(Position(0.2, 4.0), Vector(-1.0, 0.0), 0.5)};

    Integrator::step(balls, box, 0.0);
    Integrator::step(balls, box, -0.1);
    IntegratorConfig noSubsteps;
    noSubsteps.substeps = 0;
    Integrator::step(balls, box, 0.1, noSubsteps);

    EXPECT_EQ(balls[0].position.x, 0.2);
    EXPECT_EQ(balls[0].velocity.x, -1.0);
}

TEST_F(IntegratorTest, RelaxationSettlesChainOfOverlaps) {
    std::vector<Body> chain = {
        Body(Position(0.0, 0.0), Vector(), 0.5),
        Body(Position(0.9, 0.0), Vector(), 0.5),
        Body(Position(1.8, 0.0), Vector(), 0.5),
        Body(Position(2.6, 0.0), Vector(), 0.5),
    };
    double centroid0 = 0.0;
    for (const auto& b : chain) centroid0 += b.position.x;

    std::size_t contacts = Integrator::relax(chain, 20);
    EXPECT_GT(contacts, 0u);

    for (std::size_t i = 0; i < chain.size(); ++i) {
        for (std::size_t j = i + 1; j < chain.size(); ++j) {
            EXPECT_LT(CollisionDetector::checkCollision(chain[i], chain[j]).overlap, 1e-6)
                << "pair " << i << "," << j;
        }
    }
    for (std::size_t i = 1; i < chain.size(); ++i) {
        EXPECT_LT(chain[i - 1].position.x, chain[i].position.x);
    }

    double centroid1 = 0.0;
    for (const auto& b : chain) centroid1 += b.position.x;
    EXPECT_NEAR(centroid1, centroid0, 1e-12);
}

TEST_F(IntegratorTest, RelaxationWithZeroPassesDoesNothing) {
    std::vector<Body> pair = {
        Body(Position(0.0, 0.0), Vector(), 0.5),
        Body(Position(0.5, 0.0), Vector(), 0.5),
    };
    EXPECT_EQ(Integrator::relax(pair, 0), 0u);
    EXPECT_EQ(pair[1].position.x, 0.5);
}
