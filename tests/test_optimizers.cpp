#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "connection_graph.h"
#include "core_optimizer.h"
#include "shift_optimizer.h"
#include <stdexcept>

static std::vector<Circle> pair(double halfDistance){
    return {Circle({-halfDistance, 0}, 1.0), Circle({halfDistance, 0}, 1.0)};
}

TEST_CASE("removed area of disjoint and overlapping fibers") {
    auto apart = pair(1.5);
    REQUIRE(GlobalShiftOptimizer::totalRemovedArea(apart) == Approx(0.0).margin(1e-9));
    auto close = pair(0.9);
    PairConnection c(close[0], close[1]);
    REQUIRE(GlobalShiftOptimizer::totalRemovedArea(close) == Approx(c.removedArea()));
}

TEST_CASE("assembly topology follows the pair rule") {
    auto deep = pair(0.5);
    auto deepConnections = ConnectionGraph::build(deep);
    REQUIRE(GlobalShiftOptimizer::assemblyTopology(deepConnections, deep) == Topology::Convex);

    auto shallow = pair(0.9);
    auto shallowConnections = ConnectionGraph::build(shallow);
    REQUIRE(GlobalShiftOptimizer::assemblyTopology(shallowConnections, shallow) == Topology::Concave);
}

TEST_CASE("no connections gives zero shift") {
    std::vector<Circle> fibers = {Circle({0, 0}, 1.0), Circle({5, 0}, 1.0)};
    std::vector<PairConnection> none;
    ShiftSearchResult r = GlobalShiftOptimizer::findShift(none, fibers);
    REQUIRE(r.shift == 0.0);
    REQUIRE(r.success);
    REQUIRE(r.topology == Topology::Undefined);
}

TEST_CASE("concave shift conserves area") {
    auto fibers = pair(0.9);
    auto connections = ConnectionGraph::build(fibers);
    ShiftSearchOptions opts;
    opts.toleranceFactor = 1e-4;
    int trials = 0;
    opts.observer = [&](double, double, double, double){ ++trials; };
    ShiftSearchResult r = GlobalShiftOptimizer::findShift(connections, fibers, opts);
    REQUIRE(r.success);
    REQUIRE(r.topology == Topology::Concave);
    REQUIRE(r.lower == Approx(std::sqrt(1.0 - 0.81)));
    REQUIRE(r.upper == Approx(1800.0));
    REQUIRE(r.shift > r.lower);
    REQUIRE(r.cost < 1e-3);
    REQUIRE(r.addedArea == Approx(r.removedArea).margin(1e-3));
    REQUIRE(trials == r.evaluations);
    // connections are left at the accepted shift
    REQUIRE(connections[0].shift() == r.shift);
    REQUIRE(connections[0].topology() == Topology::Concave);
}

TEST_CASE("convex shift conserves area") {
    auto fibers = pair(0.5);
    auto connections = ConnectionGraph::build(fibers);
    ShiftSearchOptions opts;
    opts.toleranceFactor = 1e-4;
    ShiftSearchResult r = GlobalShiftOptimizer::findShift(connections, fibers, opts);
    REQUIRE(r.success);
    REQUIRE(r.topology == Topology::Convex);
    REQUIRE(r.lower == 0.0);
    REQUIRE(r.cost < 1e-3);
}

TEST_CASE("explicit shift bounds") {
    auto fibers = pair(0.9);
    auto connections = ConnectionGraph::build(fibers);
    ShiftSearchOptions opts;
    opts.bounds = std::make_pair(0.0, 20.0);
    ShiftSearchResult r = GlobalShiftOptimizer::findShift(connections, fibers, opts);
    REQUIRE(r.lower == Approx(std::sqrt(1.0 - 0.81)));
    REQUIRE(r.upper == 20.0);

    opts.bounds = std::make_pair(5.0, 1.0);
    REQUIRE_THROWS_AS(GlobalShiftOptimizer::findShift(connections, fibers, opts), std::invalid_argument);
}

TEST_CASE("core shifts of a symmetric pair are mirror images") {
    auto fibers = pair(0.5);
    auto connections = ConnectionGraph::build(fibers);
    ShiftSearchOptions opts;
    opts.toleranceFactor = 1e-4;
    GlobalShiftOptimizer::findShift(connections, fibers, opts);

    CoreSearchResult r = CorePositionOptimizer::search(connections[0]);
    REQUIRE(r.success);
    REQUIRE(r.x > CorePositionOptimizer::LOWER);
    REQUIRE(r.x < CorePositionOptimizer::UPPER);
    REQUIRE(r.cost < 1e-4);
    REQUIRE(r.shiftA.x == Approx(-r.shiftB.x).margin(1e-9));
    REQUIRE(r.shiftA.y == Approx(r.shiftB.y).margin(1e-9));
    // search alone moves nothing
    REQUIRE(fibers[0].core() == fibers[0].center());

    CorePositionOptimizer::apply(connections[0], r);
    REQUIRE(connections[0].coreShift().has_value());
    REQUIRE(fibers[0].core().x == Approx(fibers[0].center().x + r.shiftA.x));
    REQUIRE(fibers[1].core().x == Approx(fibers[1].center().x + r.shiftB.x));
}

TEST_CASE("failed core search leaves cores in place") {
    auto fibers = pair(0.5);
    auto connections = ConnectionGraph::build(fibers);
    GlobalShiftOptimizer::findShift(connections, fibers);
    CoreSearchOptions opts;
    opts.maxIterations = 1;
    CoreSearchResult r = CorePositionOptimizer::optimize(connections[0], opts);
    REQUIRE_FALSE(r.success);
    REQUIRE(fibers[0].core() == fibers[0].center());
    REQUIRE(fibers[1].core() == fibers[1].center());
    REQUIRE_FALSE(connections[0].coreShift().has_value());
}

TEST_CASE("shared fibers accumulate core moves") {
    std::vector<Circle> fibers = {Circle({-1.6, 0}, 1.0), Circle({0, 0}, 1.0), Circle({1.6, 0}, 1.0)};
    auto connections = ConnectionGraph::build(fibers);
    REQUIRE(connections.size() == 2);
    GlobalShiftOptimizer::findShift(connections, fibers);
    auto results = CorePositionOptimizer::optimizeAll(connections);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].success);
    REQUIRE(results[1].success);
    Vec2 expected = results[0].shiftB + results[1].shiftA;
    REQUIRE(fibers[1].core().x == Approx(expected.x).margin(1e-9));
    REQUIRE(fibers[1].core().y == Approx(expected.y).margin(1e-9));
    // the middle fiber is pulled both ways by the same amount
    REQUIRE(fibers[1].core().x == Approx(0.0).margin(1e-6));
}
