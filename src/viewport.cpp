#include "viewport.hpp"
#include <algorithm>
#include <limits>

void SampleBounds::add(int x,int y){
    if(empty){ minX=maxX=x; minY=maxY=y; empty=false; return; }
    minX=std::min(minX,x); maxX=std::max(maxX,x);
    minY=std::min(minY,y); maxY=std::max(maxY,y);
}

static inline int saturate(long long v){
    return int(std::clamp<long long>(v, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

Viewport::Viewport(int w,int h):w_(w),h_(h){}
void Viewport::resize(int w,int h){ w_=w; h_=h; }
void Viewport::setZoom(int z){ zoom_ = std::clamp(z, 1, kMaxZoom); }

void Viewport::fit(const SampleBounds& b, int margin, int maxZoom){
    if(b.empty){ zoom_=1; ox_=w_/2; oy_=h_/2; return; }
    const long long bw = (long long)b.maxX - b.minX + 1;
    const long long bh = (long long)b.maxY - b.minY + 1;
    const long long aw = std::max(1, w_ - 2*margin);
    const long long ah = std::max(1, h_ - 2*margin);
    zoom_ = int(std::clamp<long long>(std::min(aw/bw, ah/bh), 1, std::clamp(maxZoom, 1, kMaxZoom)));
    // center of the box lands on the center of the canvas
    ox_ = saturate((w_ - bw*zoom_)/2 - (long long)b.minX*zoom_);
    oy_ = saturate((h_ - bh*zoom_)/2 - (long long)b.minY*zoom_);
}

rmx::ivec2 Viewport::toScreen(int x,int y) const {
    return { saturate(ox_ + (long long)x*zoom_), saturate(oy_ + (long long)y*zoom_) };
}

static inline long long floorDiv(long long a,long long b){ long long q=a/b; if((a%b!=0) && ((a<0)!=(b<0))) --q; return q; }

rmx::ivec2 Viewport::fromScreen(int sx,int sy) const {
    return { saturate(floorDiv((long long)sx-ox_, zoom_)), saturate(floorDiv((long long)sy-oy_, zoom_)) };
}
