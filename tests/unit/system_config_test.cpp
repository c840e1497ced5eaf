#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "elastic/core/scenario_config.hpp"
#include "elastic/core/system_config.hpp"

TEST(SystemConfigTest, DefaultsAreValid) {
    SystemConfig cfg;
    EXPECT_FALSE(validateSystemConfig(cfg).has_value());

    auto boundary = cfg.boundary();
    EXPECT_DOUBLE_EQ(boundary.getWidth(), 10.0);
    EXPECT_DOUBLE_EQ(boundary.getHeight(), 8.0);

    auto integrator = cfg.integratorConfig();
    EXPECT_EQ(integrator.substeps, 400);
    EXPECT_EQ(integrator.relaxationPasses, 20);
}

TEST(SystemConfigTest, RejectsBadBoundary) {
    SystemConfig cfg;
    cfg.BoundaryWidth = 0.0;
    EXPECT_TRUE(validateSystemConfig(cfg).has_value());

    cfg.BoundaryWidth = 10.0;
    cfg.BoundaryHeight = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(validateSystemConfig(cfg).has_value());

    cfg.BoundaryHeight = std::nan("");
    EXPECT_TRUE(validateSystemConfig(cfg).has_value());
}

TEST(SystemConfigTest, RejectsBadTiming) {
    SystemConfig cfg;
    cfg.SecondsPerFrame = -0.01;
    EXPECT_TRUE(validateSystemConfig(cfg).has_value());

    cfg.SecondsPerFrame = 0.01;
    cfg.Substeps = 0;
    EXPECT_TRUE(validateSystemConfig(cfg).has_value());

    cfg.Substeps = 1;
    cfg.RelaxationPasses = -1;
    EXPECT_TRUE(validateSystemConfig(cfg).has_value());

    // Zero passes only disables contacts
    cfg.RelaxationPasses = 0;
    EXPECT_FALSE(validateSystemConfig(cfg).has_value());
}

TEST(ScenarioConfigTest, ConvertsToSystemConfig) {
    ScenarioConfig cfg;
    cfg.BoundaryWidth = 12.0;
    cfg.BoundaryHeight = 6.0;
    cfg.SecondsPerFrame = 0.02;
    cfg.Substeps = 100;
    cfg.RelaxationPasses = 5;

    SystemConfig sys = makeSystemConfig(cfg);
    EXPECT_DOUBLE_EQ(sys.BoundaryWidth, 12.0);
    EXPECT_DOUBLE_EQ(sys.BoundaryHeight, 6.0);
    EXPECT_DOUBLE_EQ(sys.SecondsPerFrame, 0.02);
    EXPECT_EQ(sys.Substeps, 100);
    EXPECT_EQ(sys.RelaxationPasses, 5);
    EXPECT_EQ(sys.activeSystems, cfg.activeSystems);
}

TEST(ScenarioConfigTest, RejectsBadGeneratorRanges) {
    ScenarioConfig cfg;
    EXPECT_FALSE(validateScenarioConfig(cfg).has_value());

    ScenarioConfig radius = cfg;
    radius.RadiusMin = 0.7;
    radius.RadiusMax = 0.5;
    EXPECT_TRUE(validateScenarioConfig(radius).has_value());

    ScenarioConfig tooBig = cfg;
    tooBig.RadiusMax = 4.5;
    EXPECT_TRUE(validateScenarioConfig(tooBig).has_value());

    ScenarioConfig speed = cfg;
    speed.SpeedMin = -1.0;
    EXPECT_TRUE(validateScenarioConfig(speed).has_value());

    ScenarioConfig attempts = cfg;
    attempts.PlacementAttempts = 0;
    EXPECT_TRUE(validateScenarioConfig(attempts).has_value());

    ScenarioConfig balls = cfg;
    balls.BallCount = -3;
    EXPECT_TRUE(validateScenarioConfig(balls).has_value());

    ScenarioConfig duration = cfg;
    duration.DurationSeconds = -1.0;
    EXPECT_TRUE(validateScenarioConfig(duration).has_value());
}

TEST(ScenarioConfigTest, RejectsRunsBeyondFrameLimit) {
    ScenarioConfig cfg;
    cfg.DurationSeconds = 1e300;
    cfg.SecondsPerFrame = 1e-10;
    auto err = validateScenarioConfig(cfg);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("frames"), std::string::npos);

    // Exactly at the limit is still allowed
    ScenarioConfig atLimit;
    atLimit.DurationSeconds = 1e10;
    atLimit.SecondsPerFrame = 0.01;
    EXPECT_FALSE(validateScenarioConfig(atLimit).has_value());
}

TEST(ScenarioConfigTest, ReportsSystemConfigErrors) {
    ScenarioConfig cfg;
    cfg.Substeps = 0;
    auto err = validateScenarioConfig(cfg);
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("substeps"), std::string::npos);
}
