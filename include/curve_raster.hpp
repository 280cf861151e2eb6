#pragma once
#include "raster_types.hpp"

namespace raster {

constexpr int kBezierSteps = 200; // t advances by 0.005

// Cubic Bezier through de Casteljau subdivision, sampled at kBezierSteps + 1
// evenly spaced parameter values. No arc-length reparametrization, so sample
// density follows the parameter rather than the screen.
SampleList deCasteljauCubic(const CurveRequest &c);

} // namespace raster
