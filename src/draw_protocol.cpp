#include "draw_protocol.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>
#include <cmath>
#include <limits>
#include <utility>

namespace proto {

namespace {
struct IntField {
  const char *key;
  int DrawRequest::*member;
};

const IntField kFields[] = {
    {"x1", &DrawRequest::x1}, {"y1", &DrawRequest::y1},
    {"x2", &DrawRequest::x2}, {"y2", &DrawRequest::y2},
    {"x3", &DrawRequest::x3}, {"y3", &DrawRequest::y3},
    {"x4", &DrawRequest::x4}, {"y4", &DrawRequest::y4},
    {"r", &DrawRequest::r},
};

bool readInt(const QJsonObject &o, const char *key, int &out,
             std::string &err) {
  const QJsonValue v = o.value(QLatin1String(key));
  if (v.isUndefined() || v.isNull()) {
    out = 0;
    return true;
  }
  if (!v.isDouble()) {
    err = std::string("field '") + key + "' must be a number";
    return false;
  }
  const double d = v.toDouble();
  if (!std::isfinite(d) || std::floor(d) != d ||
      d < double(std::numeric_limits<int>::min()) ||
      d > double(std::numeric_limits<int>::max())) {
    err = std::string("field '") + key + "' must be an integer";
    return false;
  }
  out = int(d);
  return true;
}
} // namespace

const char *kindName(DrawError::Kind k) {
  switch (k) {
  case DrawError::Kind::InvalidRequest:
    return "invalid_request";
  case DrawError::Kind::UnsupportedAlgorithm:
    return "unsupported_algorithm";
  }
  return "invalid_request";
}

bool parseRequest(const QJsonValue &v, DrawRequest &out, std::string &err) {
  if (!v.isObject()) {
    err = "request must be a JSON object";
    return false;
  }
  const QJsonObject o = v.toObject();
  DrawRequest req;

  const QJsonValue alg = o.value(QLatin1String("algorithm"));
  if (alg.isString())
    req.algorithm = alg.toString().toStdString();
  else if (!alg.isUndefined() && !alg.isNull()) {
    err = "field 'algorithm' must be a string";
    return false;
  }

  for (const auto &f : kFields)
    if (!readInt(o, f.key, req.*f.member, err))
      return false;

  out = std::move(req);
  return true;
}

bool parseRequests(const QByteArray &body, std::vector<DrawRequest> &out,
                   std::string &err) {
  QJsonParseError perr;
  const QJsonDocument doc = QJsonDocument::fromJson(body, &perr);
  if (perr.error != QJsonParseError::NoError) {
    err = "malformed JSON: " + perr.errorString().toStdString();
    return false;
  }
  out.clear();
  if (!doc.isArray()) {
    DrawRequest req;
    if (!parseRequest(doc.object(), req, err))
      return false;
    out.push_back(std::move(req));
    return true;
  }
  const QJsonArray arr = doc.array();
  for (int i = 0; i < arr.size(); ++i) {
    DrawRequest req;
    if (!parseRequest(arr.at(i), req, err)) {
      err = "request " + std::to_string(i) + ": " + err;
      return false;
    }
    out.push_back(std::move(req));
  }
  return true;
}

QJsonObject toJson(const DrawRequest &req) {
  QJsonObject o;
  o.insert(QLatin1String("algorithm"), QString::fromStdString(req.algorithm));
  for (const auto &f : kFields)
    o.insert(QLatin1String(f.key), req.*f.member);
  return o;
}

QJsonObject toJson(const RasterResult &res) {
  QJsonArray pts;
  for (const auto &p : res.points) {
    QJsonObject s;
    s.insert(QLatin1String("x"), p.x);
    s.insert(QLatin1String("y"), p.y);
    s.insert(QLatin1String("alpha"), p.alpha);
    pts.append(s);
  }
  QJsonObject o;
  o.insert(QLatin1String("points"), pts);
  o.insert(QLatin1String("elapsed"), qint64(res.elapsedNs));
  return o;
}

QJsonObject toJson(const DrawError &e) {
  QJsonObject o;
  o.insert(QLatin1String("error"), QString::fromStdString(e.message));
  o.insert(QLatin1String("kind"), QLatin1String(kindName(e.kind)));
  return o;
}

QByteArray serialize(const QJsonObject &o) {
  return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

} // namespace proto
