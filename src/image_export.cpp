#include "image_export.hpp"
#include <QColorSpace>
#include <QImage>
#include <QString>
#include <cstring>

bool save_png_argb32(const std::string &path, int W, int H,
                     const std::vector<uint32_t> &argb) {
  if (W <= 0 || H <= 0 || argb.size() < size_t(W) * size_t(H))
    return false;
  QImage img(W, H, QImage::Format_ARGB32);
  for (int y = 0; y < H; ++y) {
    std::memcpy(img.scanLine(y),
                reinterpret_cast<const uint8_t *>(argb.data()) +
                    size_t(y) * W * 4,
                size_t(W) * 4);
  }
  img.setColorSpace(QColorSpace::SRgb);
  return img.save(QString::fromStdString(path), "PNG");
}
