/**
 * @file random_balls.cpp
 * @brief Implementation of the random balls scenario.
 *
 * Radius, position and velocity are drawn per ball from the configured
 * ranges. Positions are drawn so the ball lies fully inside the box and are
 * rejected while they overlap an already placed ball.
 */

#include <cmath>
#include <iostream>
#include <utility>

#include "elastic/core/constants.hpp"
#include "elastic/scenarios/random_balls.hpp"
#include "elastic/systems/body_sync.hpp"

RandomBallsScenario::RandomBallsScenario(ScenarioConfig config)
    : scenarioConfig(std::move(config))
{
}

ScenarioConfig RandomBallsScenario::defaultConfig() {
    ScenarioConfig cfg;
    cfg.BoundaryWidth = 10.0;
    cfg.BoundaryHeight = 8.0;
    cfg.SecondsPerFrame = 0.01;
    cfg.DurationSeconds = 10.0;

    cfg.BallCount = 10;
    cfg.RadiusMin = 0.2;
    cfg.RadiusMax = 0.6;
    cfg.SpeedMin = 2.0;
    cfg.SpeedMax = 4.0;
    cfg.PlacementAttempts = 100;
    cfg.Seed = 42;
    return cfg;
}

ScenarioConfig RandomBallsScenario::getConfig() const {
    return scenarioConfig;
}

std::vector<Physics::Body> RandomBallsScenario::generateBodies(const ScenarioConfig& cfg,
                                                               std::mt19937& rng) {
    std::vector<Physics::Body> bodies;
    bodies.reserve(cfg.BallCount > 0 ? static_cast<std::size_t>(cfg.BallCount) : 0);

    std::uniform_real_distribution<double> radius_dist(cfg.RadiusMin, cfg.RadiusMax);
    std::uniform_real_distribution<double> speed_dist(cfg.SpeedMin, cfg.SpeedMax);
    std::uniform_real_distribution<double> angle_dist(0.0, 2.0 * SimulatorConstants::Pi);

    for (int i = 0; i < cfg.BallCount; ++i) {
        double const radius = radius_dist(rng);

        std::uniform_real_distribution<double> x_dist(radius, cfg.BoundaryWidth - radius);
        std::uniform_real_distribution<double> y_dist(radius, cfg.BoundaryHeight - radius);

        bool placed = false;
        Position position;
        for (int attempt = 0; attempt < cfg.PlacementAttempts && !placed; ++attempt) {
            Position candidate(x_dist(rng), y_dist(rng));

            bool overlapping = false;
            for (const auto& other : bodies) {
                if (candidate.dist(other.position) < radius + other.getRadius()) {
                    overlapping = true;
                    break;
                }
            }

            if (!overlapping) {
                position = candidate;
                placed = true;
            }
        }

        if (!placed) {
            std::cerr << "Warning: could not place ball " << i + 1 << " after "
                      << cfg.PlacementAttempts << " attempts" << std::endl;
            continue;
        }

        double const speed = speed_dist(rng);
        double const angle = angle_dist(rng);
        bodies.emplace_back(position,
                            Vector(speed * std::cos(angle), speed * std::sin(angle)),
                            radius);
    }

    return bodies;
}

void RandomBallsScenario::createEntities(entt::registry& registry) const {
    std::mt19937 rng(scenarioConfig.Seed);
    auto bodies = generateBodies(scenarioConfig, rng);

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        Systems::BodySync::spawnBody(registry, bodies[i], i, SimulatorConstants::paletteColor(i));
    }

    std::cerr << "Created " << bodies.size() << " of " << scenarioConfig.BallCount
              << " balls (seed " << scenarioConfig.Seed << ")" << std::endl;
}
