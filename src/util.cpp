#include "tailor/util.hpp"
#include <cmath>
#include <iostream>
#include <cstdlib>

namespace tailor {

    double clamp_min(double x, double lo) {
    return (x < lo) ? lo : x;
    }

    double clamp_to(double x, double lo, double hi) {
    if (x < lo) return lo;
    if (x > hi) return hi;
    return x;
    }

    double safe_div(double num, double den, double fallback) {
    if (!std::isfinite(num) || !std::isfinite(den)) return fallback;
    if (std::abs(den) < EPS) return fallback;
    return num / den;
    }

    double step_down(double x, double step) {
    if (!(step > 0.0)) return x;
    return std::floor(x / step) * step;
    }

    bool is_finite(double x) {
    return std::isfinite(x);
    }

    void die(const std::string& msg) {
    std::cerr << msg << "\n";
    std::exit(1);
    }

    void require_finite(double x, const char* name, int period) {
    if (!std::isfinite(x)) die(std::string("invariant fail period=") + std::to_string(period) + " non-finite " + name);
    }

    void require_nonneg(double x, const char* name, int period) {
    if (!(x >= -NONNEG_TOL)) die(std::string("invariant fail period=") + std::to_string(period) + " negative " + name + " value=" + std::to_string(x));
    }

    void require_within(double x, double lo, double hi, const char* name, int period) {
    if (!(x >= lo - NONNEG_TOL && x <= hi + NONNEG_TOL))
      die(std::string("invariant fail period=") + std::to_string(period) + " " + name + " out of [" + std::to_string(lo) + "," + std::to_string(hi) + "] value=" + std::to_string(x));
    }

}
