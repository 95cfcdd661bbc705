#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "bvh.h"
#include "connection_graph.h"
#include <stdexcept>

TEST_CASE("far apart fibers have no connections") {
    std::vector<Circle> fibers = {Circle({0, 0}, 1.0), Circle({10, 0}, 1.0), Circle({0, 10}, 1.0)};
    REQUIRE(ConnectionGraph::build(fibers).empty());
}

TEST_CASE("tangent fibers are not connected") {
    std::vector<Circle> fibers = {Circle({0, 0}, 1.0), Circle({2, 0}, 1.0)};
    REQUIRE(ConnectionGraph::build(fibers).empty());
}

TEST_CASE("chain connects neighbours only") {
    std::vector<Circle> fibers = {Circle({0, 0}, 1.0), Circle({1.8, 0}, 1.0), Circle({3.6, 0}, 1.0)};
    auto connections = ConnectionGraph::build(fibers);
    REQUIRE(connections.size() == 2);
    REQUIRE(connections[0].indexA() == 0);
    REQUIRE(connections[0].indexB() == 1);
    REQUIRE(connections[1].indexA() == 1);
    REQUIRE(connections[1].indexB() == 2);
    REQUIRE(&connections[0].fiberA() == &fibers[0]);
    REQUIRE(&connections[1].fiberB() == &fibers[2]);
}

TEST_CASE("ring of seven connects every touching pair") {
    std::vector<Circle> fibers = {Circle({0, 0}, 1.0)};
    for(int k=0;k<6;++k){
        double ang = k * M_PI / 3.0;
        fibers.emplace_back(Vec2{1.8 * std::cos(ang), 1.8 * std::sin(ang)}, 1.0);
    }
    // six spokes plus six rim neighbours
    REQUIRE(ConnectionGraph::build(fibers).size() == 12);
}

TEST_CASE("coincident fibers are rejected") {
    std::vector<Circle> fibers = {Circle({0, 0}, 1.0), Circle({0, 0}, 1.0)};
    REQUIRE_THROWS_AS(ConnectionGraph::build(fibers), std::invalid_argument);
}

TEST_CASE("bvh candidate pairs match brute force") {
    std::vector<Rect64> boxes;
    for(int i=0;i<20;++i){
        int64_t x = (i % 5) * 15, y = (i / 5) * 15;
        boxes.push_back(Rect64(x, y, x + 20, y + 20));
    }
    auto pairs = candidatePairs(buildBVH(boxes));
    std::vector<std::pair<int,int>> expected;
    for(int i=0;i<20;++i)
        for(int j=i+1;j<20;++j)
            if(boxesIntersect(boxes[i], boxes[j])) expected.emplace_back(i, j);
    REQUIRE(pairs == expected);
}

TEST_CASE("bvh of a single box has no pairs") {
    std::vector<Rect64> boxes = {Rect64(0, 0, 10, 10)};
    REQUIRE(candidatePairs(buildBVH(boxes)).empty());
    REQUIRE(candidatePairs(buildBVH({})).empty());
}
