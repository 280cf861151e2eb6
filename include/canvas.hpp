#pragma once
#include "raster_types.hpp"
#include <algorithm>
#include <cstdint>
#include <vector>

struct RGBA {
  unsigned char r, g, b, a;
  RGBA(unsigned char R = 0, unsigned char G = 0, unsigned char B = 0,
       unsigned char A = 255)
      : r(R), g(G), b(B), a(A) {}
};

inline bool operator==(const RGBA &l, const RGBA &r) {
  return l.r == r.r && l.g == r.g && l.b == r.b && l.a == r.a;
}

class Canvas {
public:
  Canvas(int w, int h);
  void resize(int w, int h);
  void clear(const RGBA &c);

  // Blends c over the cell with the given coverage; out-of-bounds cells are
  // skipped.
  void blend(int x, int y, const RGBA &c, double coverage);
  // Fills a size x size block whose top-left cell is (x, y).
  void blendBlock(int x, int y, int size, const RGBA &c, double coverage);

  RGBA at(int x, int y) const { return buf_[size_t(y) * w_ + x]; }
  int width() const { return w_; }
  int height() const { return h_; }

  // pack ARGB32 (0xAARRGGBB) as QImage::Format_ARGB32 expects
  void toARGB32(std::vector<uint32_t> &out) const;

private:
  int w_, h_;
  std::vector<RGBA> buf_;
  inline bool inBounds(int x, int y) const {
    return unsigned(x) < unsigned(w_) && unsigned(y) < unsigned(h_);
  }
};
