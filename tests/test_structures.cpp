#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "structures.h"
#include <cmath>
#include <stdexcept>

TEST_CASE("scaling factor spans the fusion degree range") {
    REQUIRE(scalingFactor(0.0) == 1.0);
    REQUIRE(scalingFactor(1.0) == Approx(std::sqrt(2.0) - 1.0));
    REQUIRE(scalingFactor(0.5) == Approx(std::sqrt(0.5)));
    REQUIRE_THROWS_AS(scalingFactor(-0.1), std::invalid_argument);
    REQUIRE_THROWS_AS(scalingFactor(1.5), std::invalid_argument);
}

TEST_CASE("ring neighbours are tangent") {
    for(int n : {2, 3, 5, 6, 9}){
        auto pts = ringLayout(n, 1.5);
        REQUIRE(pts.size() == static_cast<size_t>(n));
        for(int k=0;k<n;++k){
            Vec2 a = pts[k], b = pts[(k + 1) % n];
            REQUIRE(distance(a, b) == Approx(3.0));
        }
    }
    auto single = ringLayout(1, 1.0);
    REQUIRE(single.size() == 1);
    REQUIRE(single[0] == Vec2{0.0, 0.0});
}

TEST_CASE("ring starts on the positive y axis") {
    auto pts = ringLayout(4, 1.0);
    REQUIRE(pts[0].x == Approx(0.0).margin(1e-12));
    REQUIRE(pts[0].y == Approx(std::sqrt(2.0)));
    auto turned = ringLayout(4, 1.0, 90.0);
    REQUIRE(turned[0].x == Approx(-std::sqrt(2.0)));
}

TEST_CASE("line layout is centered") {
    auto pts = lineLayout(3, 1.0);
    REQUIRE(pts[0].x == Approx(-2.0));
    REQUIRE(pts[1].x == Approx(0.0).margin(1e-12));
    REQUIRE(pts[2].x == Approx(2.0));
    auto vertical = lineLayout(2, 1.0, 90.0);
    REQUIRE(vertical[0].x == Approx(0.0).margin(1e-12));
    REQUIRE(vertical[0].y == Approx(-1.0));
}

TEST_CASE("fusion degree pulls centers in") {
    std::vector<Vec2> pts = {{2.0, 0.0}, {0.0, -2.0}};
    applyFusionDegree(pts, 1.0);
    REQUIRE(pts[0].x == Approx(2.0 * (std::sqrt(2.0) - 1.0)));
    REQUIRE(pts[1].y == Approx(-2.0 * (std::sqrt(2.0) - 1.0)));
}

TEST_CASE("preset fiber counts") {
    REQUIRE(findPreset("ring-1")->fiberCount() == 1);
    REQUIRE(findPreset("ring-7")->fiberCount() == 7);
    REQUIRE(findPreset("ring-10")->fiberCount() == 11);
    REQUIRE(findPreset("ring-10")->centerFiber);
    REQUIRE(findPreset("ring-12")->fiberCount() == 12);
    REQUIRE(findPreset("ring-19")->fiberCount() == 19);
    REQUIRE(findPreset("line-5")->fiberCount() == 5);
    REQUIRE(findPreset("ring-42") == nullptr);
    for(const auto& p : presets())
        REQUIRE(presetCenters(p, 1.0, std::nullopt).size() == p.fiberCount());
}

TEST_CASE("user degree maps into the preset range") {
    const Preset& line3 = *findPreset("line-3");
    REQUIRE(*parametrizedFusionDegree(line3, 0.0) == Approx(0.1));
    REQUIRE(*parametrizedFusionDegree(line3, 1.0) == Approx(0.35));
    REQUIRE(*parametrizedFusionDegree(line3, std::nullopt) == Approx(0.3));
    REQUIRE_THROWS_AS(parametrizedFusionDegree(line3, 2.0), std::invalid_argument);

    const Preset& ring12 = *findPreset("ring-12");
    REQUIRE_FALSE(parametrizedFusionDegree(ring12, std::nullopt).has_value());
    REQUIRE_THROWS_AS(parametrizedFusionDegree(ring12, 0.5), std::invalid_argument);
}

TEST_CASE("make preset") {
    Assembly a = makePreset("ring-3", 1.0);
    REQUIRE(a.size() == 3);
    REQUIRE_FALSE(a.built());
    REQUIRE(a.fibers()[0].radius() == 1.0);
    REQUIRE_THROWS_AS(makePreset("hexagon", 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(makePreset("ring-19", 1.0, 0.5), std::invalid_argument);
}

TEST_CASE("scaled down preset") {
    Assembly full = makePreset("ring-19", 1.0);
    Assembly scaled = makePreset("ring-19", 1.0, std::nullopt, DEFAULT_RESOLUTION, 0.9);
    REQUIRE(scaled.size() == 19);
    for(size_t i=0;i<full.size();++i){
        REQUIRE(scaled.fibers()[i].center().x == Approx(0.9 * full.fibers()[i].center().x).margin(1e-12));
        REQUIRE(scaled.fibers()[i].center().y == Approx(0.9 * full.fibers()[i].center().y).margin(1e-12));
        REQUIRE(scaled.fibers()[i].radius() == 1.0);
    }
    REQUIRE_THROWS_AS(makePreset("ring-12", 1.0, std::nullopt, DEFAULT_RESOLUTION, 0.0), std::invalid_argument);
}

TEST_CASE("fused ring of three is one piece") {
    Assembly a = makePreset("ring-3", 1.0, 1.0);
    a.build();
    REQUIRE(a.connections().size() == 3);
    REQUIRE(a.fusedPolygon().components().size() == 1);
}

TEST_CASE("spread out preset has no connections") {
    Assembly a = makePreset("ring-7", 1.0, 0.0);
    a.scalePositions(1.05);
    a.build();
    REQUIRE(a.connections().empty());
}

TEST_CASE("scrambled cores are reproducible") {
    Assembly a = makePreset("line-2", 1.0);
    Assembly b = makePreset("line-2", 1.0);
    scrambleCores(a, 0.1, 7);
    scrambleCores(b, 0.1, 7);
    REQUIRE(a.cores() == b.cores());
    for(size_t i=0;i<a.size();++i){
        Vec2 d = a.cores()[i] - a.fibers()[i].center();
        REQUIRE(d.x >= 0.0);
        REQUIRE(d.x < 0.1);
        REQUIRE(d.y >= 0.0);
        REQUIRE(d.y < 0.1);
    }

    Assembly c = makePreset("line-2", 1.0);
    scrambleCores(c, 0.0, 7);
    for(size_t i=0;i<c.size();++i) REQUIRE(c.cores()[i] == c.fibers()[i].center());
}
