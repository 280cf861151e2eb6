#include "curve_raster.hpp"

namespace raster {

SampleList deCasteljauCubic(const CurveRequest &c) {
  const rmx::vec2 p0(c.p[0]), p1(c.p[1]), p2(c.p[2]), p3(c.p[3]);

  SampleList out;
  out.reserve(kBezierSteps + 1);
  for (int i = 0; i <= kBezierSteps; ++i) {
    const double t = double(i) / double(kBezierSteps);

    const rmx::vec2 q0 = rmx::lerp(p0, p1, t);
    const rmx::vec2 q1 = rmx::lerp(p1, p2, t);
    const rmx::vec2 q2 = rmx::lerp(p2, p3, t);

    const rmx::vec2 r0 = rmx::lerp(q0, q1, t);
    const rmx::vec2 r1 = rmx::lerp(q1, q2, t);

    const rmx::ivec2 b = rmx::roundAway(rmx::lerp(r0, r1, t));
    out.emplace_back(b.x, b.y);
  }
  return out;
}

} // namespace raster
