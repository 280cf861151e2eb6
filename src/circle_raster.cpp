#include "circle_raster.hpp"
#include <algorithm>

namespace raster {

static inline void addOctants(SampleList &out, int xc, int yc, int x, int y) {
  out.emplace_back(xc + x, yc + y);
  out.emplace_back(xc - x, yc + y);
  out.emplace_back(xc + x, yc - y);
  out.emplace_back(xc - x, yc - y);
  out.emplace_back(xc + y, yc + x);
  out.emplace_back(xc - y, yc + x);
  out.emplace_back(xc + y, yc - x);
  out.emplace_back(xc - y, yc - x);
}

SampleList bresenhamCircle(const CircleRequest &c) {
  const int xc = c.center.x, yc = c.center.y;
  const int r = std::max(c.r, 0);

  int x = 0;
  int y = r;
  long long d = 3 - 2 * (long long)r; // 3 - 2r overflows int near INT_MAX

  SampleList out;
  out.reserve((size_t(r) + 2) * 8);
  addOctants(out, xc, yc, x, y);
  // the first loop step would leave the center with x=1, y=-1
  if (r == 0)
    return out;
  while (y >= x) {
    ++x;
    if (d > 0) {
      --y;
      d += 4 * ((long long)x - y) + 10;
    } else {
      d += 4 * (long long)x + 6;
    }
    addOctants(out, xc, yc, x, y);
  }
  return out;
}

} // namespace raster
