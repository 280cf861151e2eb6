#include <catch2/catch_test_macros.hpp>
#include "wu_raster.hpp"
#include <climits>
#include <cmath>

// the first four samples are the two endpoint pairs
static constexpr size_t kEndpointSamples = 4;

static const LineRequest kLines[] = {
    {{0,0},{10,3}}, {{0,0},{3,10}}, {{-5,-2},{7,9}}, {{9,1},{-4,-6}},
    {{0,0},{-6,-2}}, {{2,8},{2,-8}}, {{0,0},{4,4}},  {{-3,5},{20,5}},
};

TEST_CASE("Wu interior pairs have complementary coverage", "[wu]") {
    for (const auto& l : kLines) {
        const auto s = raster::wuLine(l);
        REQUIRE(s.size() % 2 == 0);
        REQUIRE(s.size() >= kEndpointSamples);
        for (size_t i = kEndpointSamples; i < s.size(); i += 2) {
            REQUIRE(std::fabs(s[i].alpha + s[i+1].alpha - 1.0) < 1e-9);
        }
        for (const auto& p : s) {
            REQUIRE(p.alpha >= 0.0);
            REQUIRE(p.alpha <= 1.0);
        }
    }
}

TEST_CASE("Wu horizontal line keeps the main row fully covered", "[wu]") {
    const auto s = raster::wuLine({{0,0},{5,0}});
    REQUIRE(s.size() == 12u);
    // endpoints: half-pixel gap
    REQUIRE(s[0] == PixelSample(0,0,0.5));
    REQUIRE(s[1] == PixelSample(0,1,0.0));
    REQUIRE(s[2] == PixelSample(5,0,0.5));
    REQUIRE(s[3] == PixelSample(5,1,0.0));
    for (size_t i = kEndpointSamples; i < s.size(); i += 2) {
        REQUIRE(s[i].y == 0);
        REQUIRE(s[i].alpha == 1.0);
        REQUIRE(s[i+1].alpha == 0.0);
    }
}

TEST_CASE("Wu steep lines are transposed back", "[wu]") {
    const auto s = raster::wuLine({{0,0},{3,10}});
    // one pair per row, rows 1..9 in the interior
    REQUIRE(s.size() == kEndpointSamples + 2*9);
    int row = 1;
    for (size_t i = kEndpointSamples; i < s.size(); i += 2, ++row) {
        REQUIRE(s[i].y == row);
        REQUIRE(s[i+1].y == row);
        REQUIRE(s[i+1].x == s[i].x + 1);
        REQUIRE(s[i].x >= 0);
        REQUIRE(s[i].x <= 3);
    }
}

TEST_CASE("Wu is independent of endpoint order", "[wu]") {
    for (const auto& l : kLines) {
        REQUIRE(raster::wuLine(l) == raster::wuLine({l.b, l.a}));
        REQUIRE(raster::wuLine(l) == raster::wuLine(l));
    }
}

TEST_CASE("Wu single point does not divide by zero", "[wu]") {
    const auto s = raster::wuLine({{3,3},{3,3}});
    REQUIRE(s.size() == kEndpointSamples);
    double total = 0.0;
    for (const auto& p : s) {
        REQUIRE(p.x == 3);
        REQUIRE((p.y == 3 || p.y == 4));
        total += p.alpha;
    }
    REQUIRE(std::fabs(total - 1.0) < 1e-9);
}

TEST_CASE("Wu diagonal lands on pixel centers", "[wu]") {
    const auto s = raster::wuLine({{0,0},{4,4}});
    for (size_t i = kEndpointSamples; i < s.size(); i += 2) {
        REQUIRE(s[i].x == s[i].y);
        REQUIRE(s[i].alpha == 1.0);
    }
}

TEST_CASE("Wu short lines at the edge of the int range", "[wu]") {
    const auto h = raster::wuLine({{INT_MAX - 6, 5}, {INT_MAX, 5}});
    REQUIRE(h.size() == kEndpointSamples + 2 * 5);
    for (size_t i = kEndpointSamples; i < h.size(); i += 2) {
        REQUIRE(h[i].x == INT_MAX - 6 + int(i - kEndpointSamples) / 2 + 1);
        REQUIRE(h[i].y == 5);
        REQUIRE(h[i].alpha == 1.0);
        REQUIRE(h[i + 1].alpha == 0.0);
    }

    const auto v = raster::wuLine({{2, INT_MIN + 6}, {2, INT_MIN}});
    REQUIRE(v.size() == kEndpointSamples + 2 * 5);
    for (const auto& p : v) {
        REQUIRE((p.x == 2 || p.x == 3));
        REQUIRE(p.y <= INT_MIN + 6);
    }
}
