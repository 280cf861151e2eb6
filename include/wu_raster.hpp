#pragma once
#include "raster_types.hpp"

namespace raster {

// Xiaolin Wu antialiased line. Emits pixel pairs straddling the ideal line
// with complementary coverage: the two endpoint pairs first (start, then
// end), then one pair per interior column (row, for steep lines). Interior
// pairs sum to 1; endpoint pairs are scaled by the half-pixel end gap.
SampleList wuLine(const LineRequest &l);

} // namespace raster
