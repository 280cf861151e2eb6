#pragma once
#include "canvas.hpp"
#include "dispatcher.hpp"
#include "raster_types.hpp"
#include "viewport.hpp"
#include <cstdint>
#include <vector>

// A set of primitives rasterized together and drawn into an ARGB32 image,
// one zoom x zoom block per sample.
class RasterScene {
public:
  RasterScene(int W, int H);

  // false if req.algorithm is not a known rasterizer
  bool add(const DrawRequest &req);
  void clear();
  size_t size() const { return prims_.size(); }

  // main draw – returns ARGB32 buffer sized W×H
  const std::vector<uint32_t> &render();

  void resize(int W, int H);
  // auto-fit is on until a fixed zoom is set
  void setZoom(int z);
  void zoomBy(int delta);
  void setMonochrome(bool on) { mono_ = on; }
  void toggleMonochrome() { mono_ = !mono_; }
  void cycleColors();
  // rasterization workers, 0 → hardware_concurrency
  void setThreads(unsigned n) { threads_ = n; }

  // results of the last render()
  const std::vector<SampleList> &samples() const { return samples_; }
  size_t sampleCount() const;
  int64_t lastElapsedNs() const { return elapsed_ns_; }
  const Viewport &viewport() const { return vp_; }

  // Builds a request from clicked points: two endpoints for lines, center and
  // a rim point for the circle, four control points for the curve.
  static DrawRequest requestFromPoints(raster::Algorithm a,
                                       const std::vector<rmx::ivec2> &pts);

private:
  int W_, H_;
  bool autofit_ = true;
  bool mono_ = false;
  int color_seed_ = 0;
  unsigned threads_ = 0; // 0 → hardware_concurrency

  std::vector<DrawRequest> prims_;
  std::vector<raster::Algorithm> algos_;
  std::vector<SampleList> samples_;
  int64_t elapsed_ns_ = 0;

  Viewport vp_;
  Canvas canvas_;
  std::vector<uint32_t> out_;

  RGBA colorFor(size_t i) const;
};
