#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Writes a W×H ARGB32 buffer (RasterScene::render output) as an sRGB PNG.
bool save_png_argb32(const std::string &path, int W, int H,
                     const std::vector<uint32_t> &argb);
