#pragma once
#include "raster_types.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <string>
#include <vector>

struct DrawError {
  enum class Kind { InvalidRequest, UnsupportedAlgorithm };
  Kind kind = Kind::InvalidRequest;
  std::string message;
};

// JSON wire format of the draw endpoint:
//   request  {"algorithm": "dda", "x1": 0, "y1": 0, ..., "y4": 0, "r": 0}
//   response {"points": [{"x": 0, "y": 0, "alpha": 1.0}, ...], "elapsed": ns}
//   error    {"error": "...", "kind": "invalid_request"}
namespace proto {

const char *kindName(DrawError::Kind k);

// Missing numeric fields read as 0; present ones must be integral numbers.
bool parseRequest(const QJsonValue &v, DrawRequest &out, std::string &err);
// A single request object or an array of them; stops at the first bad one.
bool parseRequests(const QByteArray &body, std::vector<DrawRequest> &out,
                   std::string &err);

QJsonObject toJson(const DrawRequest &req);
QJsonObject toJson(const RasterResult &res);
QJsonObject toJson(const DrawError &e);

QByteArray serialize(const QJsonObject &o);

} // namespace proto
