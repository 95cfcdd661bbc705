#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "fusion_io.h"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

TEST_CASE("layout as a plain array") {
    json j = json::parse(R"([{"x": -0.9, "y": 0, "radius": 1}, {"x": 0.9, "y": 0, "radius": 1}])");
    LayoutFile f = parseLayoutJson(j);
    REQUIRE(f.fibers.size() == 2);
    REQUIRE(f.fibers[0].center.x == -0.9);
    REQUIRE(f.fibers[1].radius == 1.0);
    REQUIRE_FALSE(f.fusionDegree.has_value());
    REQUIRE_FALSE(f.shiftBounds.has_value());
}

TEST_CASE("layout object carries settings") {
    json j = json::parse(R"({
        "fibers": [{"x": 0, "y": 0, "radius": 2}],
        "fusion_degree": 0.5,
        "tolerance_factor": 0.001,
        "core_tolerance": 1e-8,
        "resolution": 64,
        "shift_bounds": [0.5, 10]
    })");
    LayoutFile f = parseLayoutJson(j);
    REQUIRE(f.fibers.size() == 1);
    REQUIRE(*f.fusionDegree == 0.5);
    REQUIRE(*f.toleranceFactor == 0.001);
    REQUIRE(*f.coreTolerance == 1e-8);
    REQUIRE(*f.resolution == 64);
    REQUIRE(f.shiftBounds->first == 0.5);
    REQUIRE(f.shiftBounds->second == 10.0);
}

TEST_CASE("bad fiber entries are skipped") {
    json j = json::parse(R"([
        {"x": 0, "y": 0, "radius": 1},
        {"x": 1, "y": 0},
        {"x": "a", "y": 0, "radius": 1},
        {"x": 2, "y": 0, "radius": -1},
        42
    ])");
    LayoutFile f = parseLayoutJson(j);
    REQUIRE(f.fibers.size() == 1);
}

TEST_CASE("malformed layouts throw") {
    REQUIRE_THROWS_AS(parseLayoutJson(json::parse(R"({"fiber": []})")), std::runtime_error);
    REQUIRE_THROWS_AS(parseLayoutJson(json::parse("3")), std::runtime_error);
    REQUIRE_THROWS_AS(parseLayoutJson(json::parse(R"({"fibers": [], "fusion_degree": "high"})")), std::runtime_error);
    REQUIRE_THROWS_AS(parseLayoutJson(json::parse(R"({"fibers": [], "shift_bounds": [1]})")), std::runtime_error);
    REQUIRE_THROWS_AS(parseLayoutJson(json::parse(R"({"fibers": [], "resolution": 1.5})")), std::runtime_error);
    REQUIRE(*parseLayoutJson(json::parse(R"({"fibers": [], "resolution": 32})")).resolution == 32);
}

TEST_CASE("loading from disk") {
    REQUIRE_THROWS_AS(loadLayoutJson("no_such_layout.json"), std::runtime_error);

    const char* bad = "fusion_io_malformed.json";
    { std::ofstream f(bad); f << "{\"fibers\": [ {\"x\": 1,"; }
    REQUIRE_THROWS_AS(loadLayoutJson(bad), std::runtime_error);
    std::remove(bad);

    const char* good = "fusion_io_layout.json";
    { std::ofstream f(good); f << R"({"fibers": [{"x": 0, "y": 0, "radius": 1}], "fusion_degree": 0.2})"; }
    LayoutFile f = loadLayoutJson(good);
    REQUIRE(f.fibers.size() == 1);
    REQUIRE(*f.fusionDegree == 0.2);
    std::remove(good);
}

TEST_CASE("result json describes the fused pair") {
    Assembly a;
    a.addFiber({-0.5, 0}, 1.0);
    a.addFiber({0.5, 0}, 1.0);
    REQUIRE_THROWS_AS(resultToJson(a), std::logic_error);
    a.build();

    json out = resultToJson(a);
    REQUIRE(out["topology"] == "convex");
    REQUIRE(out["shift"].get<double>() == a.shift());
    REQUIRE(out["fused_area"].get<double>() == Approx(a.fusedPolygon().area()));
    REQUIRE(out["converged"].get<bool>());
    REQUIRE(out["fibers"].size() == 2);
    REQUIRE(out["fibers"][1]["center"][0].get<double>() == 0.5);
    REQUIRE(out["fibers"][0]["core"][0].get<double>() == a.cores()[0].x);
    REQUIRE(out["connections"].size() == 1);
    REQUIRE(out["connections"][0]["fibers"] == json::array({0, 1}));
    REQUIRE(out["connections"][0]["distance"].get<double>() == Approx(1.0));
    REQUIRE(out["fused_polygon"].size() == a.fusedPolygon().paths().size());
}

TEST_CASE("result files are written") {
    Assembly a;
    a.addFiber({-0.9, 0}, 1.0);
    a.addFiber({0.9, 0}, 1.0);
    a.build();

    const char* jsonName = "fusion_io_result.json";
    ExportResultJson(jsonName, a);
    std::ifstream jf(jsonName);
    json back = json::parse(jf);
    REQUIRE(back["topology"] == "concave");
    jf.close();
    std::remove(jsonName);

    const char* svgName = "fusion_io_result.svg";
    ExportFusionToSVG(svgName, a);
    std::ifstream sf(svgName);
    std::stringstream buf; buf << sf.rdbuf();
    std::string svg = buf.str();
    REQUIRE(svg.rfind("<svg", 0) == 0);
    REQUIRE(svg.find("<polygon") != std::string::npos);
    REQUIRE(svg.find("<circle") != std::string::npos);
    sf.close();
    std::remove(svgName);
}
