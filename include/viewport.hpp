#pragma once
#include <vector>
#include "raster_types.hpp"

struct SampleBounds {
    int minX{}, minY{}, maxX{}, maxY{};
    bool empty{true};
    void add(int x,int y);
};

// Largest zoom a viewport accepts; one sample then covers 64x64 cells.
constexpr int kMaxZoom = 64;

// Maps sample coordinates to canvas cells: cell = origin + p * zoom, y down.
class Viewport {
public:
    Viewport(int w,int h);
    void resize(int w,int h);
    // clamped to [1, kMaxZoom]
    void setZoom(int z);
    // Largest zoom (up to maxZoom, never above kMaxZoom) that shows b whole
    // with margin cells on each side, then centers b.
    void fit(const SampleBounds& b, int margin = 8, int maxZoom = 32);
    // saturates at the int range for samples far off the canvas
    rmx::ivec2 toScreen(int x,int y) const;
    // inverse, rounding down to the containing sample
    rmx::ivec2 fromScreen(int sx,int sy) const;
    int zoom() const { return zoom_; }
    int width() const { return w_; } int height() const { return h_; }
private:
    int w_, h_;
    int ox_ = 0, oy_ = 0;
    int zoom_ = 1;
};
