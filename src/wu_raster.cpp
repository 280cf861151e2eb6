#include "wu_raster.hpp"
#include <cmath>
#include <cstdlib>
#include <utility>

namespace raster {

namespace {

// Plots in (major, minor) space and transposes back for steep lines.
struct WuPlotter {
  SampleList &out;
  bool steep;

  void operator()(int major, int minor, double alpha) const {
    if (steep)
      out.emplace_back(minor, major, alpha);
    else
      out.emplace_back(major, minor, alpha);
  }

  // pair split across minor and minor + 1
  void pair(int major, double y, double gap) const {
    (*this)(major, rmx::ipart(y), rmx::rfpart(y) * gap);
    (*this)(major, rmx::ipart(y) + 1, rmx::fpart(y) * gap);
  }
};

} // namespace

SampleList wuLine(const LineRequest &l) {
  int x1 = l.a.x, y1 = l.a.y, x2 = l.b.x, y2 = l.b.y;

  const bool steep =
      std::llabs((long long)y2 - y1) > std::llabs((long long)x2 - x1);
  if (steep) {
    std::swap(x1, y1);
    std::swap(x2, y2);
  }
  if (x2 < x1) {
    std::swap(x1, x2);
    std::swap(y1, y2);
  }

  const double dx = double(x2) - double(x1);
  const double dy = double(y2) - double(y1);
  // dx == 0 only for a single point
  const double gradient = dx == 0.0 ? 1.0 : dy / dx;

  SampleList out;
  out.reserve((size_t((long long)x2 - x1) + 2) * 2);
  const WuPlotter plot{out, steep};

  // start
  const int xPixel1 = rmx::roundHalfUp(double(x1));
  const double yEnd1 = double(y1) + gradient * (double(xPixel1) - double(x1));
  plot.pair(xPixel1, yEnd1, rmx::rfpart(double(x1) + 0.5));
  double intery = yEnd1 + gradient;

  // end
  const int xPixel2 = rmx::roundHalfUp(double(x2));
  const double yEnd2 = double(y2) + gradient * (double(xPixel2) - double(x2));
  plot.pair(xPixel2, yEnd2, rmx::fpart(double(x2) + 0.5));

  for (long long x = (long long)xPixel1 + 1; x < xPixel2; ++x) {
    plot.pair(int(x), intery, 1.0);
    intery += gradient;
  }
  return out;
}

} // namespace raster
