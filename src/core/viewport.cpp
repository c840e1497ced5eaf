/**
 * @file viewport.cpp
 * @brief Implementation of simulation/image space conversion
 */

#include "elastic/core/viewport.hpp"

#include <cmath>

namespace Simulation {

Viewport::Viewport(const SystemConfig& config, double pixelsPerMeter, double marginMeters)
    : pixelsPerMeter(pixelsPerMeter),
      marginMeters(marginMeters),
      boundaryWidth(config.BoundaryWidth),
      boundaryHeight(config.BoundaryHeight)
{
}

double Viewport::metersToPixels(double meters) const {
    return meters * pixelsPerMeter;
}

double Viewport::toScreenX(double x) const {
    return metersToPixels(x + marginMeters);
}

double Viewport::toScreenY(double y) const {
    return metersToPixels(boundaryHeight + marginMeters - y);
}

unsigned int Viewport::widthPixels() const {
    return static_cast<unsigned int>(std::ceil(metersToPixels(boundaryWidth + 2.0 * marginMeters)));
}

unsigned int Viewport::heightPixels() const {
    return static_cast<unsigned int>(std::ceil(metersToPixels(boundaryHeight + 2.0 * marginMeters)));
}

void Viewport::updateConfig(const SystemConfig& config) {
    boundaryWidth = config.BoundaryWidth;
    boundaryHeight = config.BoundaryHeight;
}

} // namespace Simulation
