#pragma once
#include "raster_math.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// One rasterized pixel. alpha is coverage in [0,1]; only the antialiased
// line rasterizer produces values other than 1.
struct PixelSample {
  int x{}, y{};
  double alpha{1.0};

  PixelSample() = default;
  PixelSample(int X, int Y, double A = 1.0) : x(X), y(Y), alpha(A) {}
};

inline bool operator==(const PixelSample &a, const PixelSample &b) {
  return a.x == b.x && a.y == b.y && a.alpha == b.alpha;
}

using SampleList = std::vector<PixelSample>;

struct LineRequest {
  rmx::ivec2 a, b;
};

struct CircleRequest {
  rmx::ivec2 center;
  int r{};
};

struct CurveRequest {
  std::array<rmx::ivec2, 4> p{};
};

// Flat record as it arrives from a client. Fields an algorithm does not need
// are ignored.
struct DrawRequest {
  std::string algorithm;
  int x1{}, y1{}, x2{}, y2{}, x3{}, y3{}, x4{}, y4{};
  int r{};

  LineRequest line() const { return {{x1, y1}, {x2, y2}}; }
  CircleRequest circle() const { return {{x1, y1}, r}; }
  CurveRequest curve() const {
    return {{{{x1, y1}, {x2, y2}, {x3, y3}, {x4, y4}}}};
  }
};

struct RasterResult {
  SampleList points;
  std::int64_t elapsedNs{}; // set by the caller, not by the rasterizer
};
