#pragma once
#include <functional>
#include <string>

struct BoundedOptions {
    double xatol = 1e-5;
    int maxEvaluations = 500;
};

struct BoundedResult {
    double x = 0.0;
    double fun = 0.0;
    int evaluations = 0;
    // 0 converged, 1 evaluation budget exhausted, 2 NaN encountered
    int status = 0;
    bool success = false;
    std::string message;
};

// Brent's bounded scalar minimization (golden section with parabolic steps).
// The bounds themselves are never evaluated. Throws std::invalid_argument on
// non-finite or reversed bounds.
BoundedResult minimizeBounded(const std::function<double(double)>& f,
                              double lower, double upper,
                              const BoundedOptions& opts = {});
