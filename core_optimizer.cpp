#include "core_optimizer.h"
#include "minimize.h"
#include <spdlog/spdlog.h>
#include <cmath>
#include <exception>
#ifdef _OPENMP
#include <omp.h>
#endif

CoreSearchResult CorePositionOptimizer::search(const PairConnection& connection, const CoreSearchOptions& opts){
    const Shape total = connection.totalArea();
    const Segment line = connection.extendedCenterLine();
    const double target = connection.fiberA().area() / 2.0;

    auto cost = [&](double x){
        Shape small = connection.splitGeometry(total, line.at(1.0 - x), false);
        double c = std::abs(small.area() - target);
        if(opts.observer) opts.observer(connection, x, c);
        return c;
    };

    BoundedOptions bopts;
    bopts.xatol = opts.tolerance;
    bopts.maxEvaluations = opts.maxIterations;
    BoundedResult found = minimizeBounded(cost, LOWER, UPPER, bopts);

    CoreSearchResult res;
    res.success = found.success;
    res.x = found.x;
    res.cost = found.fun;
    res.evaluations = found.evaluations;
    res.message = found.message;
    res.shiftA = line.at(1.0 - found.x) - connection.fiberA().center();
    res.shiftB = line.at(found.x) - connection.fiberB().center();
    return res;
}

void CorePositionOptimizer::apply(PairConnection& connection, const CoreSearchResult& result){
    if(!result.success){
        spdlog::warn("core search for connection {}-{} failed: {}; cores left in place",
                     connection.indexA(), connection.indexB(), result.message);
        return;
    }
    connection.setCoreShift(result.shiftA, result.shiftB);
    connection.fiberA().shiftCore(result.shiftA);
    connection.fiberB().shiftCore(result.shiftB);
    spdlog::debug("connection {}-{}: core split x={:.8f}, cost {:.3e}",
                  connection.indexA(), connection.indexB(), result.x, result.cost);
}

CoreSearchResult CorePositionOptimizer::optimize(PairConnection& connection, const CoreSearchOptions& opts){
    CoreSearchResult res = search(connection, opts);
    apply(connection, res);
    return res;
}

std::vector<CoreSearchResult> CorePositionOptimizer::optimizeAll(std::vector<PairConnection>& connections,
                                                                 const CoreSearchOptions& opts){
    std::vector<CoreSearchResult> results(connections.size());
    std::exception_ptr failure;
    int n = static_cast<int>(connections.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for(int i=0;i<n;++i){
        try {
            results[i] = search(connections[i], opts);
        } catch(...) {
#ifdef _OPENMP
#pragma omp critical
#endif
            if(!failure) failure = std::current_exception();
        }
    }
    if(failure) std::rethrow_exception(failure);

    // fibers shared by several connections accumulate every move
    for(size_t i=0;i<connections.size();++i) apply(connections[i], results[i]);
    return results;
}
