#pragma once
#include "connection.h"
#include <functional>
#include <optional>
#include <utility>
#include <vector>

// called once per trial shift
using ShiftObserver = std::function<void(double shift, double added, double removed, double cost)>;

struct ShiftSearchOptions {
    // xatol = smallest center distance * toleranceFactor
    double toleranceFactor = 1e-2;
    // default [max minimumShift, 1000 * smallest center distance]
    std::optional<std::pair<double, double>> bounds;
    int maxIterations = 500;
    ShiftObserver observer;
};

struct ShiftSearchResult {
    double shift = 0.0;
    Topology topology = Topology::Undefined;
    double cost = 0.0;
    double addedArea = 0.0;
    double removedArea = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    int evaluations = 0;
    bool success = true;
};

// Finds the one virtual shift shared by every connection that balances the
// total added area against the total removed area.
class GlobalShiftOptimizer {
public:
    static ShiftSearchResult findShift(std::vector<PairConnection>& connections,
                                       const std::vector<Circle>& fibers,
                                       const ShiftSearchOptions& opts = {});

    // Convex iff the summed removed area exceeds the summed neck capacity.
    static Topology assemblyTopology(const std::vector<PairConnection>& connections,
                                     const std::vector<Circle>& fibers);
    static double totalRemovedArea(const std::vector<Circle>& fibers);
    // union of added sections minus the disks; sections must be configured
    static double totalAddedArea(const std::vector<PairConnection>& connections,
                                 const std::vector<Circle>& fibers);
};
