#include "raster_scene.hpp"
#include "parallel.hpp"
#include <chrono>
#include <algorithm>
#include <cmath>

RasterScene::RasterScene(int W, int H)
    : W_(W), H_(H), vp_(W, H), canvas_(W, H) {}

bool RasterScene::add(const DrawRequest& req){
    const auto a = raster::parseAlgorithm(req.algorithm);
    if(!a) return false;
    prims_.push_back(req);
    algos_.push_back(*a);
    return true;
}

void RasterScene::clear(){
    prims_.clear(); algos_.clear(); samples_.clear();
    elapsed_ns_ = 0;
}

void RasterScene::resize(int W,int H){ W_=W; H_=H; vp_.resize(W,H); }

void RasterScene::setZoom(int z){ autofit_ = false; vp_.setZoom(z); }
void RasterScene::zoomBy(int delta){ setZoom(vp_.zoom() + delta); }

void RasterScene::cycleColors(){ ++color_seed_; }

size_t RasterScene::sampleCount() const {
    size_t n=0; for(const auto& s: samples_) n += s.size(); return n;
}

static inline unsigned char clampU8(int v){ return (unsigned char)std::clamp(v,0,255); }
RGBA RasterScene::colorFor(size_t i) const {
    if(mono_) return RGBA{0,0,0,255};
    uint32_t h = (uint32_t(i) + uint32_t(color_seed_) + 1u) * 2654435761u; // Knuth hash
    unsigned char r = (h>>16)&0xFF, g=(h>>8)&0xFF, b=h&0xFF;
    // keep it dark enough to read on white
    r = clampU8(int(r)*2/3); g = clampU8(int(g)*2/3); b = clampU8(int(b)*2/3);
    return RGBA{r,g,b,255};
}

DrawRequest RasterScene::requestFromPoints(raster::Algorithm a,
                                           const std::vector<rmx::ivec2>& pts){
    DrawRequest req;
    req.algorithm = raster::algorithmName(a);
    auto at = [&](size_t i){ return i < pts.size() ? pts[i] : (pts.empty() ? rmx::ivec2{} : pts.back()); };
    req.x1=at(0).x; req.y1=at(0).y;
    req.x2=at(1).x; req.y2=at(1).y;
    req.x3=at(2).x; req.y3=at(2).y;
    req.x4=at(3).x; req.y4=at(3).y;
    if(a == raster::Algorithm::BresenhamCircle){
        const double dx = req.x2 - req.x1, dy = req.y2 - req.y1;
        req.r = rmx::roundAway(std::sqrt(dx*dx + dy*dy));
    }
    return req;
}

const std::vector<uint32_t>& RasterScene::render(){
    // 1) rasterize, timed
    samples_.assign(prims_.size(), SampleList{});
    const auto t0 = std::chrono::steady_clock::now();
    par::parallel_for(0, prims_.size(), [&](std::size_t i){
        samples_[i] = raster::rasterize(algos_[i], prims_[i]);
    }, threads_ ? threads_ : par::hw_threads());
    elapsed_ns_ = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - t0).count();

    // 2) place
    if(autofit_){
        SampleBounds b;
        for(const auto& s: samples_) for(const auto& p: s) b.add(p.x,p.y);
        vp_.fit(b);
    }

    // 3) draw in insertion order, later primitives on top
    canvas_.resize(W_,H_);
    canvas_.clear({255,255,255,255});
    const int z = vp_.zoom();
    for(size_t i=0;i<samples_.size();++i){
        const RGBA c = colorFor(i);
        for(const auto& p: samples_[i]){
            const auto s = vp_.toScreen(p.x,p.y);
            canvas_.blendBlock(s.x, s.y, z, c, p.alpha);
        }
    }

    canvas_.toARGB32(out_);
    return out_;
}
