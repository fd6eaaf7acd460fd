#pragma once

namespace tailor {

constexpr double EPS = 1e-12;
constexpr double NONNEG_TOL = 1e-9;

constexpr double INDEX_MIN = 0.0;
constexpr double INDEX_MAX = 100.0;

}
