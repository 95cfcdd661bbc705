#include "shift_optimizer.h"
#include "minimize.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#ifdef _OPENMP
#include <omp.h>
#endif

static Shape fiberUnion(const std::vector<Circle>& fibers){
    std::vector<Shape> disks;
    disks.reserve(fibers.size());
    for(const auto& f : fibers) disks.push_back(f.shape());
    return unionAll(disks);
}

double GlobalShiftOptimizer::totalRemovedArea(const std::vector<Circle>& fibers){
    double sum = 0.0;
    for(const auto& f : fibers) sum += f.area();
    return sum - fiberUnion(fibers).area();
}

double GlobalShiftOptimizer::totalAddedArea(const std::vector<PairConnection>& connections,
                                            const std::vector<Circle>& fibers){
    std::vector<Shape> sections;
    sections.reserve(connections.size());
    for(const auto& c : connections) sections.push_back(c.addedSection());
    return unionAll(sections).difference(fiberUnion(fibers)).area();
}

Topology GlobalShiftOptimizer::assemblyTopology(const std::vector<PairConnection>& connections,
                                                const std::vector<Circle>& fibers){
    std::vector<Shape> limits;
    limits.reserve(connections.size());
    for(const auto& c : connections) limits.push_back(c.limitAddedArea());
    double capacity = unionAll(limits).difference(fiberUnion(fibers)).area();
    return totalRemovedArea(fibers) > capacity ? Topology::Convex : Topology::Concave;
}

static void configureAll(std::vector<PairConnection>& connections, double shift, Topology topology){
    std::exception_ptr failure;
    int n = static_cast<int>(connections.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for(int i=0;i<n;++i){
        try {
            connections[i].configure(shift, topology);
        } catch(...) {
#ifdef _OPENMP
#pragma omp critical
#endif
            if(!failure) failure = std::current_exception();
        }
    }
    if(failure) std::rethrow_exception(failure);
}

ShiftSearchResult GlobalShiftOptimizer::findShift(std::vector<PairConnection>& connections,
                                                  const std::vector<Circle>& fibers,
                                                  const ShiftSearchOptions& opts){
    ShiftSearchResult res;
    if(connections.empty()){
        spdlog::warn("no overlapping fibers, shift set to 0");
        return res;
    }

    res.topology = assemblyTopology(connections, fibers);
    res.removedArea = totalRemovedArea(fibers);

    double minDistance = std::numeric_limits<double>::infinity();
    double minShift = 0.0;
    for(const auto& c : connections){
        minDistance = std::min(minDistance, c.distanceBetweenCenters());
        minShift = std::max(minShift, c.minimumShift(res.topology));
    }

    double lower = minShift;
    double upper = 1e3 * minDistance;
    if(opts.bounds){
        lower = opts.bounds->first;
        upper = opts.bounds->second;
        if(lower < minShift){
            spdlog::warn("shift lower bound {:.6g} raised to {:.6g} for {} topology",
                         lower, minShift, toString(res.topology));
            lower = minShift;
        }
    }
    if(!(lower < upper))
        throw std::invalid_argument("empty shift search interval [" + std::to_string(lower) +
                                    ", " + std::to_string(upper) + "]");
    res.lower = lower;
    res.upper = upper;

    auto cost = [&](double shift){
        configureAll(connections, shift, res.topology);
        double added = totalAddedArea(connections, fibers);
        double c = std::abs(added - res.removedArea);
        if(opts.observer) opts.observer(shift, added, res.removedArea, c);
        return c;
    };

    BoundedOptions bopts;
    bopts.xatol = minDistance * opts.toleranceFactor;
    bopts.maxEvaluations = opts.maxIterations;
    BoundedResult search = minimizeBounded(cost, lower, upper, bopts);
    if(!search.success)
        spdlog::warn("shift search did not converge ({}), keeping shift {:.6g}", search.message, search.x);

    // leave every connection in the state of the accepted shift
    configureAll(connections, search.x, res.topology);
    res.shift = search.x;
    res.addedArea = totalAddedArea(connections, fibers);
    res.cost = std::abs(res.addedArea - res.removedArea);
    res.evaluations = search.evaluations;
    res.success = search.success;
    spdlog::info("shift {:.6g} ({} topology), added {:.6g}, removed {:.6g}, {} evaluations",
                 res.shift, toString(res.topology), res.addedArea, res.removedArea, res.evaluations);
    return res;
}
