#pragma once
#include "raster_types.hpp"

namespace raster {

// Slope-intercept line: y = kx + b for shallow lines, x = (y - b) / k for
// steep ones. Vertical lines are emitted with ascending y whatever the
// request direction.
SampleList stepwiseLine(const LineRequest &l);

// Digital differential analyzer. max(|dx|,|dy|) + 1 samples, a zero-length
// line yields its single point.
SampleList ddaLine(const LineRequest &l);

// Integer Bresenham. Exact endpoints, and the same point set for A->B and
// B->A.
SampleList bresenhamLine(const LineRequest &l);

} // namespace raster
