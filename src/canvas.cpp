#include "canvas.hpp"
#include <algorithm>
#include <cmath>

Canvas::Canvas(int w, int h) : w_(w), h_(h), buf_(size_t(w) * h) {}
void Canvas::resize(int w, int h) {
  w_ = w;
  h_ = h;
  buf_.assign(size_t(w) * h, RGBA{});
}
void Canvas::clear(const RGBA &c) {
  std::fill(buf_.begin(), buf_.end(), c);
}

static inline unsigned char mix8(unsigned char dst, unsigned char src,
                                 float t) {
  return (unsigned char)std::lround(float(dst) + t * (float(src) - float(dst)));
}

void Canvas::blend(int x, int y, const RGBA &c, double coverage) {
  if (!inBounds(x, y))
    return;
  const float t = float(rmx::clamp01(coverage)) * (float(c.a) / 255.f);
  if (t <= 0.f)
    return;
  RGBA &d = buf_[size_t(y) * w_ + x];
  d = RGBA{mix8(d.r, c.r, t), mix8(d.g, c.g, t), mix8(d.b, c.b, t),
           mix8(d.a, 255, t)};
}

void Canvas::blendBlock(int x, int y, int size, const RGBA &c,
                        double coverage) {
  // clip in 64 bits: x, y may sit at the edge of the int range
  const long long x0 = std::max<long long>(x, 0);
  const long long y0 = std::max<long long>(y, 0);
  const long long x1 = std::min<long long>((long long)x + size, w_);
  const long long y1 = std::min<long long>((long long)y + size, h_);
  for (long long j = y0; j < y1; ++j)
    for (long long i = x0; i < x1; ++i)
      blend(int(i), int(j), c, coverage);
}

void Canvas::toARGB32(std::vector<uint32_t> &out) const {
  out.resize(buf_.size());
  for (size_t i = 0; i < buf_.size(); ++i) {
    const auto &c = buf_[i];
    out[i] = (uint32_t(c.a) << 24) | (uint32_t(c.r) << 16) |
             (uint32_t(c.g) << 8) | uint32_t(c.b);
  }
}
