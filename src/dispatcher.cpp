#include "dispatcher.hpp"
#include "circle_raster.hpp"
#include "curve_raster.hpp"
#include "line_raster.hpp"
#include "wu_raster.hpp"

namespace raster {

namespace {
struct NamedAlgorithm {
  std::string_view name;
  Algorithm algorithm;
};

constexpr NamedAlgorithm kNames[] = {
    {"stepwise", Algorithm::Stepwise},
    {"dda", Algorithm::DDA},
    {"bresenham-line", Algorithm::BresenhamLine},
    {"bresenham-circle", Algorithm::BresenhamCircle},
    {"bezier-cubic", Algorithm::BezierCubic},
    {"wu-antialiased", Algorithm::WuAntialiased},
    // aliases
    {"step", Algorithm::Stepwise},
    {"bresenham_line", Algorithm::BresenhamLine},
    {"bresenham_circle", Algorithm::BresenhamCircle},
    {"casteljau", Algorithm::BezierCubic},
    {"wu", Algorithm::WuAntialiased},
};
} // namespace

UnsupportedAlgorithm::UnsupportedAlgorithm(const std::string &name)
    : std::invalid_argument("unsupported algorithm '" + name + "'"),
      name_(name) {}

std::optional<Algorithm> parseAlgorithm(std::string_view name) {
  for (const auto &n : kNames)
    if (n.name == name)
      return n.algorithm;
  return std::nullopt;
}

const char *algorithmName(Algorithm a) {
  switch (a) {
  case Algorithm::Stepwise:
    return "stepwise";
  case Algorithm::DDA:
    return "dda";
  case Algorithm::BresenhamLine:
    return "bresenham-line";
  case Algorithm::BresenhamCircle:
    return "bresenham-circle";
  case Algorithm::BezierCubic:
    return "bezier-cubic";
  case Algorithm::WuAntialiased:
    return "wu-antialiased";
  }
  return "?";
}

Algorithm nextAlgorithm(Algorithm a) {
  return Algorithm((int(a) + 1) % kAlgorithmCount);
}

int controlPointCount(Algorithm a) {
  return a == Algorithm::BezierCubic ? 4 : 2;
}

SampleList rasterize(Algorithm a, const DrawRequest &req) {
  switch (a) {
  case Algorithm::Stepwise:
    return stepwiseLine(req.line());
  case Algorithm::DDA:
    return ddaLine(req.line());
  case Algorithm::BresenhamLine:
    return bresenhamLine(req.line());
  case Algorithm::BresenhamCircle:
    return bresenhamCircle(req.circle());
  case Algorithm::BezierCubic:
    return deCasteljauCubic(req.curve());
  case Algorithm::WuAntialiased:
    return wuLine(req.line());
  }
  throw UnsupportedAlgorithm(std::to_string(int(a)));
}

SampleList rasterize(const DrawRequest &req) {
  const auto a = parseAlgorithm(req.algorithm);
  if (!a)
    throw UnsupportedAlgorithm(req.algorithm);
  return rasterize(*a, req);
}

} // namespace raster
