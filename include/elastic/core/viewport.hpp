/**
 * @file viewport.hpp
 * @brief Conversion between simulation space and image space
 *
 * Simulation space is metres with y pointing up and the boundary spanning
 * [0,width] x [0,height]. Image space is pixels with y pointing down. A
 * margin of blank metres surrounds the boundary on every side.
 */
#pragma once

#include "elastic/core/constants.hpp"
#include "elastic/core/system_config.hpp"

namespace Simulation {

/**
 * @class Viewport
 * @brief Maps metres to pixels for a fixed boundary
 */
class Viewport {
public:
    /**
     * @brief Construct a viewport for the boundary in @p config
     *
     * @param config System configuration with the boundary size
     * @param pixelsPerMeter Scale (default: from SimulatorConstants)
     * @param marginMeters Border around the boundary (default: from SimulatorConstants)
     */
    explicit Viewport(const SystemConfig& config,
                      double pixelsPerMeter = SimulatorConstants::PixelsPerMeter,
                      double marginMeters = SimulatorConstants::ViewMarginMeters);

    /**
     * @brief Scale a length from metres to pixels
     */
    double metersToPixels(double meters) const;

    /**
     * @brief Horizontal pixel coordinate of simulation x
     */
    double toScreenX(double x) const;

    /**
     * @brief Vertical pixel coordinate of simulation y (flipped)
     */
    double toScreenY(double y) const;

    unsigned int widthPixels() const;
    unsigned int heightPixels() const;

    double getPixelsPerMeter() const { return pixelsPerMeter; }
    double getMarginMeters() const { return marginMeters; }
    double getBoundaryWidth() const { return boundaryWidth; }
    double getBoundaryHeight() const { return boundaryHeight; }

    /**
     * @brief Update the boundary size
     *
     * @param config New system configuration
     */
    void updateConfig(const SystemConfig& config);

private:
    double pixelsPerMeter;
    double marginMeters;
    double boundaryWidth;
    double boundaryHeight;
};

} // namespace Simulation
