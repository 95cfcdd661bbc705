#include "minimize.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

static double signOrOne(double v){
    return v > 0.0 ? 1.0 : (v < 0.0 ? -1.0 : 1.0);
}

BoundedResult minimizeBounded(const std::function<double(double)>& f,
                              double lower, double upper,
                              const BoundedOptions& opts){
    if(!std::isfinite(lower) || !std::isfinite(upper))
        throw std::invalid_argument("minimizeBounded: bounds must be finite");
    if(lower > upper)
        throw std::invalid_argument("minimizeBounded: lower bound exceeds upper bound");
    if(opts.maxEvaluations < 1)
        throw std::invalid_argument("minimizeBounded: evaluation budget must be positive");

    const double sqrtEps = std::sqrt(2.2e-16);
    const double goldenMean = 0.5 * (3.0 - std::sqrt(5.0));

    double a = lower, b = upper;
    double fulc = a + goldenMean * (b - a);
    double nfc = fulc, xf = fulc;
    double rat = 0.0, e = 0.0;
    double x = xf;
    double fx = f(x);
    int num = 1;
    double fu = std::numeric_limits<double>::infinity();
    double ffulc = fx, fnfc = fx;
    double xm = 0.5 * (a + b);
    double tol1 = sqrtEps * std::abs(xf) + opts.xatol / 3.0;
    double tol2 = 2.0 * tol1;
    int status = 0;

    while(std::abs(xf - xm) > (tol2 - 0.5 * (b - a))){
        bool golden = true;
        if(std::abs(e) > tol1){
            golden = false;
            double r = (xf - nfc) * (fx - ffulc);
            double q = (xf - fulc) * (fx - fnfc);
            double p = (xf - fulc) * q - (xf - nfc) * r;
            q = 2.0 * (q - r);
            if(q > 0.0) p = -p;
            q = std::abs(q);
            r = e;
            e = rat;
            if(std::abs(p) < std::abs(0.5 * q * r) && p > q * (a - xf) && p < q * (b - xf)){
                // parabolic step
                rat = p / q;
                x = xf + rat;
                if((x - a) < tol2 || (b - x) < tol2)
                    rat = tol1 * signOrOne(xm - xf);
            } else {
                golden = true;
            }
        }
        if(golden){
            e = (xf >= xm) ? a - xf : b - xf;
            rat = goldenMean * e;
        }

        x = xf + signOrOne(rat) * std::max(std::abs(rat), tol1);
        fu = f(x);
        ++num;

        if(fu <= fx){
            if(x >= xf) a = xf; else b = xf;
            fulc = nfc; ffulc = fnfc;
            nfc = xf; fnfc = fx;
            xf = x; fx = fu;
        } else {
            if(x < xf) a = x; else b = x;
            if(fu <= fnfc || nfc == xf){
                fulc = nfc; ffulc = fnfc;
                nfc = x; fnfc = fu;
            } else if(fu <= ffulc || fulc == xf || fulc == nfc){
                fulc = x; ffulc = fu;
            }
        }

        xm = 0.5 * (a + b);
        tol1 = sqrtEps * std::abs(xf) + opts.xatol / 3.0;
        tol2 = 2.0 * tol1;

        if(num >= opts.maxEvaluations){
            status = 1;
            break;
        }
    }

    if(std::isnan(xf) || std::isnan(fx) || std::isnan(fu)) status = 2;

    BoundedResult res;
    res.x = xf;
    res.fun = fx;
    res.evaluations = num;
    res.status = status;
    res.success = status == 0;
    switch(status){
    case 0: res.message = "solution found"; break;
    case 1: res.message = "maximum number of function evaluations exceeded"; break;
    default: res.message = "NaN result encountered"; break;
    }
    return res;
}
