/**
 * @file random_balls.hpp
 * @brief Declaration of the RandomBallsScenario class
 */

#pragma once

#include <random>
#include <vector>
#include <entt/entt.hpp>

#include "elastic/core/i_scenario.hpp"
#include "elastic/physics/body.hpp"

/**
 * @class RandomBallsScenario
 *
 * Balls of random radius and speed scattered over the box by rejection
 * sampling. A ball that finds no free spot within PlacementAttempts tries
 * is skipped, so fewer than BallCount balls may be created.
 */
class RandomBallsScenario : public IScenario {
public:
    explicit RandomBallsScenario(ScenarioConfig config = defaultConfig());
    ~RandomBallsScenario() override = default;

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry &registry) const override;

    static ScenarioConfig defaultConfig();

    /**
     * @brief Generates non-overlapping bodies inside the configured box
     * @param cfg Box size and generator ranges
     * @param rng Random engine; the same seed gives the same bodies
     */
    static std::vector<Physics::Body> generateBodies(const ScenarioConfig& cfg, std::mt19937& rng);

private:
    ScenarioConfig scenarioConfig;
};
