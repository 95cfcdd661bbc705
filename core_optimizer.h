#pragma once
#include "connection.h"
#include <functional>
#include <string>
#include <vector>

// Called on every cost evaluation. optimizeAll may call it from several
// threads at once.
using CoreObserver = std::function<void(const PairConnection& connection, double x, double cost)>;

struct CoreSearchOptions {
    double tolerance = 1e-10;
    int maxIterations = 500;
    CoreObserver observer;
};

struct CoreSearchResult {
    bool success = false;
    double x = 0.0;
    double cost = 0.0;
    Vec2 shiftA;
    Vec2 shiftB;
    int evaluations = 0;
    std::string message;
};

// Moves each fiber core toward the split point that leaves it half of the
// fused pair footprint.
class CorePositionOptimizer {
public:
    // split parameter range along the extended center line
    static constexpr double LOWER = 0.50001;
    static constexpr double UPPER = 0.99;

    // Pure: evaluates the connection as configured, changes nothing.
    static CoreSearchResult search(const PairConnection& connection, const CoreSearchOptions& opts = {});
    // Applies a successful result to the connection and both fiber cores.
    static void apply(PairConnection& connection, const CoreSearchResult& result);
    static CoreSearchResult optimize(PairConnection& connection, const CoreSearchOptions& opts = {});
    // Searches all pairs concurrently, then accumulates the core moves in order.
    static std::vector<CoreSearchResult> optimizeAll(std::vector<PairConnection>& connections,
                                                     const CoreSearchOptions& opts = {});
};
