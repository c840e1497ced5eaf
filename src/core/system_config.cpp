#include "elastic/core/system_config.hpp"

#include <cmath>
#include <sstream>

Physics::Boundary SystemConfig::boundary() const {
    return Physics::Boundary(BoundaryWidth, BoundaryHeight);
}

Physics::IntegratorConfig SystemConfig::integratorConfig() const {
    Physics::IntegratorConfig cfg;
    cfg.substeps = Substeps;
    cfg.relaxationPasses = RelaxationPasses;
    return cfg;
}

std::optional<std::string> validateSystemConfig(const SystemConfig& cfg) {
    std::ostringstream err;
    if (!(cfg.BoundaryWidth > 0.0) || !std::isfinite(cfg.BoundaryWidth) ||
        !(cfg.BoundaryHeight > 0.0) || !std::isfinite(cfg.BoundaryHeight)) {
        err << "boundary must have positive finite size, got "
            << cfg.BoundaryWidth << "x" << cfg.BoundaryHeight;
        return err.str();
    }
    if (!(cfg.SecondsPerFrame > 0.0) || !std::isfinite(cfg.SecondsPerFrame)) {
        err << "time step must be positive, got " << cfg.SecondsPerFrame;
        return err.str();
    }
    if (cfg.Substeps < 1) {
        err << "substeps must be at least 1, got " << cfg.Substeps;
        return err.str();
    }
    if (cfg.RelaxationPasses < 0) {
        err << "relaxation passes must not be negative, got " << cfg.RelaxationPasses;
        return err.str();
    }
    return std::nullopt;
}
