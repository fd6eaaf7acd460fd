#pragma once
#include <string>
#include "tailor/constants.hpp"

namespace tailor {

    double clamp_min(double x, double lo);
    double clamp_to(double x, double lo, double hi);
    double safe_div(double num, double den, double fallback = 0.0);
    double step_down(double x, double step);
    bool is_finite(double x);
    [[noreturn]] void die(const std::string& msg);

    void require_finite(double x, const char* name, int period);
    void require_nonneg(double x, const char* name, int period);
    void require_within(double x, double lo, double hi, const char* name, int period);

}
