#include <catch2/catch_test_macros.hpp>
#include "canvas.hpp"
#include "raster_scene.hpp"
#include "viewport.hpp"
#include <climits>
#include <utility>
#include <vector>

static bool has_any_non_white(const std::vector<uint32_t>& img) {
    for (auto p : img) if (p != 0xFFFFFFFFu) return true;
    return false;
}

static DrawRequest line(const char* algo, int x1, int y1, int x2, int y2) {
    DrawRequest r; r.algorithm = algo;
    r.x1 = x1; r.y1 = y1; r.x2 = x2; r.y2 = y2;
    return r;
}

TEST_CASE("RasterScene renders a visible line", "[render]") {
    RasterScene scene(64, 64);
    REQUIRE(scene.add(line("bresenham-line", 0, 0, 20, 10)));

    const auto& img = scene.render();
    REQUIRE(img.size() == 64u*64u);
    REQUIRE(has_any_non_white(img));
    REQUIRE(scene.samples().size() == 1u);
    REQUIRE(scene.sampleCount() == 21u);
    REQUIRE(scene.lastElapsedNs() >= 0);
}

TEST_CASE("Monochrome mode draws black pixels", "[render]") {
    RasterScene scene(64, 64);
    REQUIRE(scene.add(line("dda", -5, 3, 12, -7)));
    scene.setMonochrome(true);

    const auto& img = scene.render();
    bool saw_black = false;
    for (auto p : img) {
        if (p == 0xFF000000u) { saw_black = true; break; } // exact black ARGB
    }
    REQUIRE(saw_black);
}

TEST_CASE("RasterScene refuses unknown algorithms", "[render]") {
    RasterScene scene(32, 32);
    REQUIRE_FALSE(scene.add(line("scanline", 0, 0, 1, 1)));
    REQUIRE(scene.size() == 0u);
    const auto& img = scene.render();
    REQUIRE_FALSE(has_any_non_white(img));
}

TEST_CASE("Fixed zoom paints one block per sample", "[render]") {
    RasterScene scene(40, 40);
    scene.setMonochrome(true);
    scene.setZoom(4);
    REQUIRE(scene.add(line("bresenham-line", 2, 2, 2, 2)));

    const auto& img = scene.render();
    size_t black = 0;
    for (auto p : img) if (p == 0xFF000000u) ++black;
    REQUIRE(black == 16u);
    REQUIRE(img[size_t(8) * 40 + 8] == 0xFF000000u);
    REQUIRE(img[size_t(12) * 40 + 12] == 0xFFFFFFFFu);
}

TEST_CASE("Circle request from a center and a rim point", "[render]") {
    const auto req = RasterScene::requestFromPoints(raster::Algorithm::BresenhamCircle,
                                                    {{0, 0}, {3, 4}});
    REQUIRE(req.algorithm == "bresenham-circle");
    REQUIRE(req.x1 == 0);
    REQUIRE(req.y1 == 0);
    REQUIRE(req.r == 5);

    const auto curve = RasterScene::requestFromPoints(raster::Algorithm::BezierCubic,
                                                      {{1, 1}, {2, 2}, {3, 3}, {4, 4}});
    REQUIRE(curve.x4 == 4);
    REQUIRE(curve.y3 == 3);
}

TEST_CASE("Canvas blends by coverage", "[canvas]") {
    Canvas c(4, 4);
    c.clear({255, 255, 255, 255});
    c.blend(1, 1, RGBA{0, 0, 0, 255}, 0.5);
    c.blend(2, 2, RGBA{0, 0, 0, 255}, 0.0);
    c.blend(-1, 9, RGBA{0, 0, 0, 255}, 1.0); // ignored

    REQUIRE(c.at(1, 1).r == 128);
    REQUIRE(c.at(2, 2) == RGBA(255, 255, 255, 255));

    std::vector<uint32_t> argb;
    c.toARGB32(argb);
    REQUIRE(argb.size() == 16u);
    REQUIRE(argb[0] == 0xFFFFFFFFu);
}

TEST_CASE("Viewport fits and maps back", "[viewport]") {
    Viewport vp(100, 100);
    SampleBounds b;
    b.add(0, 0);
    b.add(9, 9);
    vp.fit(b);
    REQUIRE(vp.zoom() == 8);
    REQUIRE(vp.toScreen(0, 0).x == 10);
    REQUIRE(vp.toScreen(9, 9).y == 82);
    REQUIRE(vp.fromScreen(10, 10) == rmx::ivec2{0, 0});
    REQUIRE(vp.fromScreen(17, 17) == rmx::ivec2{0, 0});
    REQUIRE(vp.fromScreen(9, 9) == rmx::ivec2{-1, -1});
}

TEST_CASE("Zoom is capped on both ends", "[viewport]") {
    RasterScene scene(32, 32);
    scene.setZoom(1 << 20);
    REQUIRE(scene.viewport().zoom() == kMaxZoom);
    scene.zoomBy(1);
    REQUIRE(scene.viewport().zoom() == kMaxZoom);
    scene.setZoom(-3);
    REQUIRE(scene.viewport().zoom() == 1);

    Viewport vp(32, 32);
    vp.setZoom(INT_MAX);
    REQUIRE(vp.zoom() == kMaxZoom);
    // far-off samples saturate instead of wrapping onto the canvas
    REQUIRE(vp.toScreen(INT_MAX, INT_MIN) == rmx::ivec2{INT_MAX, INT_MIN});

    // fixed huge zoom on a far-off sample paints nothing and does not wrap
    scene.setZoom(1 << 20);
    scene.setMonochrome(true);
    REQUIRE(scene.add(line("bresenham-line", INT_MAX - 1, 0, INT_MAX, 0)));
    REQUIRE_FALSE(has_any_non_white(scene.render()));
}

TEST_CASE("Rendering does not depend on the worker count", "[render]") {
    auto build = [](unsigned threads) {
        RasterScene scene(96, 96);
        scene.setThreads(threads);
        for (int i = 0; i < 2048; ++i) {
            const char* algo = raster::algorithmName(raster::Algorithm(i % raster::kAlgorithmCount));
            DrawRequest r = line(algo, i % 37 - 18, i % 23 - 11, i % 41 - 20, i % 19 - 9);
            r.x3 = i % 13; r.y3 = -(i % 7); r.x4 = i % 29 - 14; r.y4 = i % 11;
            r.r = i % 9;
            REQUIRE(scene.add(r));
        }
        std::vector<uint32_t> img = scene.render();
        return std::make_pair(scene.samples(), img);
    };
    const auto one = build(1);
    const auto four = build(4);
    REQUIRE(one.first.size() == 2048u);
    REQUIRE(one.first == four.first);
    REQUIRE(one.second == four.second);
}
