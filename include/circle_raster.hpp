#pragma once
#include "raster_types.hpp"

namespace raster {

// Midpoint (Bresenham) circle. Computes one octant and mirrors each point
// eight ways, so samples come out batch by batch rather than in angular
// order. Duplicates on the axes and diagonals are kept; r <= 0 gives eight
// copies of the center.
SampleList bresenhamCircle(const CircleRequest &c);

} // namespace raster
