#include "controls.hpp"
#include "draw_protocol.hpp"
#include "raster_scene.hpp"
#include <QApplication>
#include <QFile>
#include <QWidget>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  QApplication qapp(argc, argv);

  RasterScene scene(1000, 1000);

  // optional: start from a request file
  if (argc >= 2) {
    QFile f(QString::fromLocal8Bit(argv[1]));
    if (!f.open(QIODevice::ReadOnly)) {
      qWarning("Failed to open %s", argv[1]);
      return 2;
    }
    std::vector<DrawRequest> reqs;
    std::string err;
    if (!proto::parseRequests(f.readAll(), reqs, err)) {
      qWarning("%s: %s", argv[1], err.c_str());
      return 2;
    }
    for (const auto &r : reqs)
      if (!scene.add(r))
        qWarning("skipping unsupported algorithm '%s'", r.algorithm.c_str());
  }

  RasterWidget w(&scene);
  w.resize(1000, 1000);
  w.show();

  return qapp.exec();
}
