#pragma once
#include "draw_protocol.hpp"
#include "raster_types.hpp"
#include <QByteArray>
#include <string>
#include <vector>

struct DrawServiceConfig {
  // hard upper bound for maxCoordinate; keeps a single line or circle within
  // 64-bit step counts and a sane sample vector
  static constexpr int kMaxCoordinateCeiling = 1 << 24;

  // largest accepted |coordinate| and radius; bounds the work per request
  int maxCoordinate = 100000;
  unsigned threads = 0; // batch workers, 0 → hardware_concurrency

  // RASTERLAB_MAX_COORD, RASTERLAB_THREADS
  static DrawServiceConfig fromEnvironment();
};

struct DrawOutcome {
  bool ok = false;
  RasterResult result;
  DrawError error;
};

// Request/response boundary around the rasterizers: validation, dispatch,
// timing, and the JSON encoding of both directions.
class DrawService {
public:
  explicit DrawService(const DrawServiceConfig &cfg = {});

  DrawOutcome handle(const DrawRequest &req) const;
  // Independent requests, answered in input order.
  std::vector<DrawOutcome> handleBatch(const std::vector<DrawRequest> &reqs) const;

  // Accepts one request object or an array of them. allOk is cleared when the
  // body does not parse or any request is rejected.
  QByteArray handleJson(const QByteArray &body, bool *allOk = nullptr) const;

  bool validate(const DrawRequest &req, std::string &err) const;
  const DrawServiceConfig &config() const { return cfg_; }

private:
  DrawServiceConfig cfg_;

  DrawOutcome handleValue(const QJsonValue &v) const;
};
