#pragma once
#include "raster_types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace raster {

enum class Algorithm {
  Stepwise,
  DDA,
  BresenhamLine,
  BresenhamCircle,
  BezierCubic,
  WuAntialiased
};
// keep in step with the last enumerator
constexpr int kAlgorithmCount = int(Algorithm::WuAntialiased) + 1;

class UnsupportedAlgorithm : public std::invalid_argument {
public:
  explicit UnsupportedAlgorithm(const std::string &name);
  const std::string &name() const { return name_; }

private:
  std::string name_;
};

// Canonical names ("bresenham-line") and the short wire names used by older
// clients ("bresenham_line", "step", "casteljau", "wu").
std::optional<Algorithm> parseAlgorithm(std::string_view name);
const char *algorithmName(Algorithm a);
// Following algorithm in declaration order, wrapping to the first.
Algorithm nextAlgorithm(Algorithm a);

// Number of control points a client has to supply (circle: center plus a
// point on the rim, see RasterScene).
int controlPointCount(Algorithm a);

SampleList rasterize(Algorithm a, const DrawRequest &req);
// Throws UnsupportedAlgorithm for an unknown req.algorithm.
SampleList rasterize(const DrawRequest &req);

} // namespace raster
