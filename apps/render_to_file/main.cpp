#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <QByteArray>

#include "draw_protocol.hpp"
#include "draw_service.hpp"
#include "image_export.hpp"
#include "raster_scene.hpp"

static void usage() {
  std::cerr << "Usage:\n"
               "  render-to-file <request.json> <output.png> [-b|--black]\n"
               "\n"
               "  request.json holds one draw request or an array of them:\n"
               "    {\"algorithm\": \"wu-antialiased\", \"x1\": 0, \"y1\": 0, "
               "\"x2\": 40, \"y2\": 15}\n"
               "  Algorithms: stepwise, dda, bresenham-line, "
               "bresenham-circle,\n"
               "              bezier-cubic, wu-antialiased\n"
               "\n"
               "Environment:\n"
               "  RTF_WIDTH, RTF_HEIGHT  image size (default 800x800)\n"
               "  RTF_ZOOM               pixels per sample, 1..64 (default: fit)\n";
}

int main(int argc, char **argv) {
  bool mono = false;
  if (argc == 4) {
    std::string f = argv[3];
    if (f == "-b" || f == "--black")
      mono = true;
    else {
      usage();
      return 1;
    }
  } else if (argc != 3) {
    usage();
    return 1;
  }
  const std::string inJson = argv[1];
  const std::string outPng = argv[2];

  std::ifstream is(inJson, std::ios::binary);
  if (!is) {
    std::cerr << "Failed to open " << inJson << "\n";
    return 3;
  }
  const std::string body{std::istreambuf_iterator<char>(is),
                         std::istreambuf_iterator<char>()};

  std::vector<DrawRequest> reqs;
  std::string err;
  if (!proto::parseRequests(QByteArray::fromStdString(body), reqs, err)) {
    std::cerr << inJson << ": " << err << "\n";
    return 2;
  }

  int W = 800, H = 800;
  if (const char *w = std::getenv("RTF_WIDTH"))
    W = std::max(16, std::atoi(w));
  if (const char *h = std::getenv("RTF_HEIGHT"))
    H = std::max(16, std::atoi(h));

  const DrawService service(DrawServiceConfig::fromEnvironment());
  RasterScene scene(W, H);
  scene.setMonochrome(mono);
  if (const char *z = std::getenv("RTF_ZOOM"))
    scene.setZoom(std::atoi(z)); // clamped to [1, kMaxZoom]

  for (size_t i = 0; i < reqs.size(); ++i) {
    if (!service.validate(reqs[i], err)) {
      std::cerr << "request " << i << ": " << err << "\n";
      return 2;
    }
    if (!scene.add(reqs[i])) {
      std::cerr << "request " << i << ": unsupported algorithm '"
                << reqs[i].algorithm << "'\n";
      return 2;
    }
  }

  const auto &pixels = scene.render();
  if (!save_png_argb32(outPng, W, H, pixels)) {
    std::cerr << "Failed to write " << outPng << "\n";
    return 3;
  }
  std::cout << "Wrote " << outPng << "  " << W << "x" << H << "  "
            << scene.size() << " primitive(s), " << scene.sampleCount()
            << " samples, zoom " << scene.viewport().zoom() << ", "
            << scene.lastElapsedNs() << " ns\n";
  return 0;
}
