#include "line_raster.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace raster {

SampleList stepwiseLine(const LineRequest &l) {
  // deltas and loop counters in 64 bits: int endpoints may span the whole range
  const long long x1 = l.a.x, y1 = l.a.y, x2 = l.b.x, y2 = l.b.y;
  const long long dx = x2 - x1;
  const long long dy = y2 - y1;
  SampleList out;

  // vertical: slope undefined
  if (dx == 0) {
    const long long y0 = std::min(y1, y2), yn = std::max(y1, y2);
    out.reserve(size_t(yn - y0) + 1);
    for (long long y = y0; y <= yn; ++y)
      out.emplace_back(int(x1), int(y));
    return out;
  }

  const double k = double(dy) / double(dx);
  const double b = double(y1) - k * double(x1);

  if (std::llabs(dx) >= std::llabs(dy)) {
    const long long step = x2 < x1 ? -1 : 1;
    out.reserve(size_t(std::llabs(dx)) + 1);
    for (long long x = x1; x != x2 + step; x += step)
      out.emplace_back(int(x), rmx::roundAway(k * double(x) + b));
  } else {
    // |dy| > |dx| > 0, so k != 0
    const long long step = y2 < y1 ? -1 : 1;
    out.reserve(size_t(std::llabs(dy)) + 1);
    for (long long y = y1; y != y2 + step; y += step)
      out.emplace_back(rmx::roundAway((double(y) - b) / k), int(y));
  }
  return out;
}

SampleList ddaLine(const LineRequest &l) {
  const long long dx = (long long)l.b.x - l.a.x;
  const long long dy = (long long)l.b.y - l.a.y;
  const long long steps = std::max(std::llabs(dx), std::llabs(dy));
  if (steps == 0)
    return {PixelSample{l.a.x, l.a.y}};

  const double xInc = double(dx) / double(steps);
  const double yInc = double(dy) / double(steps);

  SampleList out;
  out.reserve(size_t(steps) + 1);
  for (long long i = 0; i <= steps; ++i) {
    // i * inc from the start rather than a running sum; the last sample lands
    // on the end point exactly
    const double x = i == steps ? double(l.b.x) : double(l.a.x) + xInc * double(i);
    const double y = i == steps ? double(l.b.y) : double(l.a.y) + yInc * double(i);
    out.emplace_back(rmx::roundAway(x), rmx::roundAway(y));
  }
  return out;
}

static void bresenhamWalk(rmx::ivec2 from, rmx::ivec2 to, SampleList &out) {
  const long long dx = std::llabs((long long)to.x - from.x);
  const long long dy = std::llabs((long long)to.y - from.y);
  const int sx = from.x < to.x ? 1 : -1;
  const int sy = from.y < to.y ? 1 : -1;
  long long err = dx - dy;
  int x = from.x, y = from.y;

  out.reserve(size_t(std::max(dx, dy)) + 1);
  while (true) {
    out.emplace_back(x, y);
    if (x == to.x && y == to.y)
      break;
    const long long e2 = 2 * err;
    // both may fire: diagonal step
    if (e2 > -dy) {
      err -= dy;
      x += sx;
    }
    if (e2 < dx) {
      err += dx;
      y += sy;
    }
  }
}

SampleList bresenhamLine(const LineRequest &l) {
  SampleList out;
  // The error term breaks ties differently per direction. Walk from the
  // smaller endpoint and reverse so both directions cover the same pixels.
  if (l.b < l.a) {
    bresenhamWalk(l.b, l.a, out);
    std::reverse(out.begin(), out.end());
  } else {
    bresenhamWalk(l.a, l.b, out);
  }
  return out;
}

} // namespace raster
