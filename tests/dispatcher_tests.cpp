#include <catch2/catch_test_macros.hpp>
#include "circle_raster.hpp"
#include "curve_raster.hpp"
#include "dispatcher.hpp"
#include "line_raster.hpp"
#include "wu_raster.hpp"
#include <set>

static DrawRequest makeRequest(const char* algo) {
    DrawRequest r;
    r.algorithm = algo;
    r.x1 = 1;  r.y1 = 2;  r.x2 = 17; r.y2 = -9;
    r.x3 = 30; r.y3 = 4;  r.x4 = 8;  r.y4 = 25;
    r.r = 6;
    return r;
}

TEST_CASE("Algorithm names parse and print back", "[dispatch]") {
    using raster::Algorithm;
    const Algorithm all[] = {Algorithm::Stepwise, Algorithm::DDA, Algorithm::BresenhamLine,
                             Algorithm::BresenhamCircle, Algorithm::BezierCubic,
                             Algorithm::WuAntialiased};
    for (auto a : all) {
        const auto parsed = raster::parseAlgorithm(raster::algorithmName(a));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == a);
    }
    REQUIRE(raster::parseAlgorithm("step") == Algorithm::Stepwise);
    REQUIRE(raster::parseAlgorithm("bresenham_line") == Algorithm::BresenhamLine);
    REQUIRE(raster::parseAlgorithm("bresenham_circle") == Algorithm::BresenhamCircle);
    REQUIRE(raster::parseAlgorithm("casteljau") == Algorithm::BezierCubic);
    REQUIRE(raster::parseAlgorithm("wu") == Algorithm::WuAntialiased);
    REQUIRE_FALSE(raster::parseAlgorithm("DDA").has_value());
    REQUIRE_FALSE(raster::parseAlgorithm("").has_value());
}

TEST_CASE("Algorithm cycle visits every algorithm once", "[dispatch]") {
    using raster::Algorithm;
    std::set<Algorithm> seen;
    Algorithm a = Algorithm::Stepwise;
    for (int i = 0; i < raster::kAlgorithmCount; ++i) {
        REQUIRE(seen.insert(a).second);
        REQUIRE(raster::parseAlgorithm(raster::algorithmName(a)) == a);
        a = raster::nextAlgorithm(a);
    }
    REQUIRE(a == Algorithm::Stepwise);
    REQUIRE(raster::nextAlgorithm(Algorithm::WuAntialiased) == Algorithm::Stepwise);
    REQUIRE(seen.count(Algorithm::WuAntialiased) == 1u);
}

TEST_CASE("Unknown algorithm is rejected", "[dispatch]") {
    REQUIRE_THROWS_AS(raster::rasterize(makeRequest("flood-fill")), raster::UnsupportedAlgorithm);
    try {
        raster::rasterize(makeRequest("flood-fill"));
        FAIL("expected UnsupportedAlgorithm");
    } catch (const raster::UnsupportedAlgorithm& e) {
        REQUIRE(e.name() == "flood-fill");
    }
}

TEST_CASE("Dispatcher routes the fields each rasterizer needs", "[dispatch]") {
    const LineRequest line{{1,2},{17,-9}};
    REQUIRE(raster::rasterize(makeRequest("stepwise")) == raster::stepwiseLine(line));
    REQUIRE(raster::rasterize(makeRequest("dda")) == raster::ddaLine(line));
    REQUIRE(raster::rasterize(makeRequest("bresenham-line")) == raster::bresenhamLine(line));
    REQUIRE(raster::rasterize(makeRequest("wu-antialiased")) == raster::wuLine(line));
    REQUIRE(raster::rasterize(makeRequest("bresenham-circle")) ==
            raster::bresenhamCircle({{1,2}, 6}));
    REQUIRE(raster::rasterize(makeRequest("bezier-cubic")) ==
            raster::deCasteljauCubic({{{{1,2},{17,-9},{30,4},{8,25}}}}));
}

TEST_CASE("Circle ignores the second point, lines ignore the radius", "[dispatch]") {
    auto a = makeRequest("bresenham-circle");
    auto b = a; b.x2 = 999; b.y4 = -999;
    REQUIRE(raster::rasterize(a) == raster::rasterize(b));

    auto c = makeRequest("dda");
    auto d = c; d.r = 1000; d.x3 = 5;
    REQUIRE(raster::rasterize(c) == raster::rasterize(d));
}

TEST_CASE("Only the antialiased line produces fractional alpha", "[dispatch]") {
    for (const char* name : {"stepwise", "dda", "bresenham-line", "bresenham-circle", "bezier-cubic"}) {
        for (const auto& p : raster::rasterize(makeRequest(name)))
            REQUIRE(p.alpha == 1.0);
    }
    bool fractional = false;
    for (const auto& p : raster::rasterize(makeRequest("wu")))
        if (p.alpha > 0.0 && p.alpha < 1.0) fractional = true;
    REQUIRE(fractional);
}
