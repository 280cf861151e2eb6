#include "draw_service.hpp"
#include "dispatcher.hpp"
#include "parallel.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <algorithm>
#include <chrono>
#include <cstdlib>

// debug output is off unless QT_LOGGING_RULES="rasterlab.service.debug=true"
Q_LOGGING_CATEGORY(lcService, "rasterlab.service", QtInfoMsg)

DrawServiceConfig DrawServiceConfig::fromEnvironment() {
  DrawServiceConfig cfg;
  if (const char *m = std::getenv("RASTERLAB_MAX_COORD"))
    cfg.maxCoordinate =
        std::clamp(std::atoi(m), 1, DrawServiceConfig::kMaxCoordinateCeiling);
  if (const char *t = std::getenv("RASTERLAB_THREADS"))
    cfg.threads = unsigned(std::max(0, std::atoi(t)));
  return cfg;
}

DrawService::DrawService(const DrawServiceConfig &cfg) : cfg_(cfg) {
  cfg_.maxCoordinate = std::clamp(cfg_.maxCoordinate, 1,
                                  DrawServiceConfig::kMaxCoordinateCeiling);
}

bool DrawService::validate(const DrawRequest &req, std::string &err) const {
  const auto a = raster::parseAlgorithm(req.algorithm);
  // unknown names are the dispatcher's to reject
  if (!a)
    return true;

  const int lim = cfg_.maxCoordinate;
  auto inRange = [lim](int v) { return v >= -lim && v <= lim; };
  const int coords[] = {req.x1, req.y1, req.x2, req.y2,
                        req.x3, req.y3, req.x4, req.y4};
  // circle reads the center only, lines the first two points
  const int used = *a == raster::Algorithm::BezierCubic       ? 8
                   : *a == raster::Algorithm::BresenhamCircle ? 2
                                                              : 4;
  for (int i = 0; i < used; ++i) {
    if (!inRange(coords[i])) {
      err = "coordinate out of range [-" + std::to_string(lim) + ", " +
            std::to_string(lim) + "]";
      return false;
    }
  }
  if (*a == raster::Algorithm::BresenhamCircle) {
    if (req.r < 0) {
      err = "radius must be non-negative";
      return false;
    }
    if (req.r > lim) {
      err = "radius larger than " + std::to_string(lim);
      return false;
    }
  }
  return true;
}

DrawOutcome DrawService::handle(const DrawRequest &req) const {
  DrawOutcome out;
  std::string err;
  if (!validate(req, err)) {
    qCWarning(lcService) << "rejected" << req.algorithm.c_str() << ":"
                         << err.c_str();
    out.error = {DrawError::Kind::InvalidRequest, err};
    return out;
  }

  try {
    const auto t0 = std::chrono::steady_clock::now();
    out.result.points = raster::rasterize(req);
    out.result.elapsedNs =
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - t0)
            .count();
  } catch (const raster::UnsupportedAlgorithm &e) {
    qCWarning(lcService) << e.what();
    out.error = {DrawError::Kind::UnsupportedAlgorithm, e.what()};
    return out;
  }

  out.ok = true;
  qCDebug(lcService) << req.algorithm.c_str() << out.result.points.size()
                     << "samples in" << out.result.elapsedNs << "ns";
  return out;
}

std::vector<DrawOutcome>
DrawService::handleBatch(const std::vector<DrawRequest> &reqs) const {
  std::vector<DrawOutcome> out(reqs.size());
  par::parallel_for(
      0, reqs.size(), [&](std::size_t i) { out[i] = handle(reqs[i]); },
      cfg_.threads ? cfg_.threads : par::hw_threads());
  return out;
}

DrawOutcome DrawService::handleValue(const QJsonValue &v) const {
  DrawRequest req;
  std::string err;
  if (!proto::parseRequest(v, req, err)) {
    qCWarning(lcService) << "bad request:" << err.c_str();
    DrawOutcome out;
    out.error = {DrawError::Kind::InvalidRequest, err};
    return out;
  }
  return handle(req);
}

static QJsonObject outcomeJson(const DrawOutcome &o) {
  return o.ok ? proto::toJson(o.result) : proto::toJson(o.error);
}

QByteArray DrawService::handleJson(const QByteArray &body, bool *allOk) const {
  if (allOk)
    *allOk = true;

  QJsonParseError perr;
  const QJsonDocument doc = QJsonDocument::fromJson(body, &perr);
  if (perr.error != QJsonParseError::NoError) {
    if (allOk)
      *allOk = false;
    const std::string msg = "malformed JSON: " + perr.errorString().toStdString();
    qCWarning(lcService) << msg.c_str();
    return proto::serialize(
        proto::toJson(DrawError{DrawError::Kind::InvalidRequest, msg}));
  }

  if (!doc.isArray()) {
    const DrawOutcome o = handleValue(doc.object());
    if (allOk && !o.ok)
      *allOk = false;
    return proto::serialize(outcomeJson(o));
  }

  const QJsonArray arr = doc.array();
  std::vector<DrawOutcome> outcomes(size_t(arr.size()));
  par::parallel_for(
      0, outcomes.size(),
      [&](std::size_t i) { outcomes[i] = handleValue(arr.at(int(i))); },
      cfg_.threads ? cfg_.threads : par::hw_threads());

  QJsonArray res;
  for (const auto &o : outcomes) {
    if (allOk && !o.ok)
      *allOk = false;
    res.append(outcomeJson(o));
  }
  return QJsonDocument(res).toJson(QJsonDocument::Compact);
}
