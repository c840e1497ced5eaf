#include "elastic/core/scenario_config.hpp"

#include <sstream>

SystemConfig makeSystemConfig(const ScenarioConfig& cfg) {
    SystemConfig sys;
    sys.BoundaryWidth    = cfg.BoundaryWidth;
    sys.BoundaryHeight   = cfg.BoundaryHeight;
    sys.SecondsPerFrame  = cfg.SecondsPerFrame;
    sys.Substeps         = cfg.Substeps;
    sys.RelaxationPasses = cfg.RelaxationPasses;
    sys.activeSystems    = cfg.activeSystems;
    return sys;
}

std::optional<std::string> validateScenarioConfig(const ScenarioConfig& cfg) {
    if (auto err = validateSystemConfig(makeSystemConfig(cfg))) {
        return err;
    }

    std::ostringstream err;
    if (!(cfg.DurationSeconds >= 0.0)) {
        err << "duration must not be negative, got " << cfg.DurationSeconds;
        return err.str();
    }
    if (!(cfg.DurationSeconds / cfg.SecondsPerFrame <= MaxFramesPerRun)) {
        err << "duration " << cfg.DurationSeconds << " s at " << cfg.SecondsPerFrame
            << " s per frame exceeds " << MaxFramesPerRun << " frames";
        return err.str();
    }
    if (cfg.BallCount < 0) {
        err << "ball count must not be negative, got " << cfg.BallCount;
        return err.str();
    }
    if (!(cfg.RadiusMin > 0.0) || cfg.RadiusMax < cfg.RadiusMin) {
        err << "radius range must satisfy 0 < min <= max, got ["
            << cfg.RadiusMin << ", " << cfg.RadiusMax << "]";
        return err.str();
    }
    if (2.0 * cfg.RadiusMax > cfg.BoundaryWidth || 2.0 * cfg.RadiusMax > cfg.BoundaryHeight) {
        err << "largest ball (radius " << cfg.RadiusMax << ") does not fit in the boundary";
        return err.str();
    }
    if (cfg.SpeedMin < 0.0 || cfg.SpeedMax < cfg.SpeedMin) {
        err << "speed range must satisfy 0 <= min <= max, got ["
            << cfg.SpeedMin << ", " << cfg.SpeedMax << "]";
        return err.str();
    }
    if (cfg.PlacementAttempts < 1) {
        err << "placement attempts must be at least 1, got " << cfg.PlacementAttempts;
        return err.str();
    }
    return std::nullopt;
}
