#pragma once
#include "tailor/config.hpp"
#include "tailor/state.hpp"
#include "tailor/inputs.hpp"

namespace tailor {

struct WorkforceOutcome {
  Workforce workforce;
  Machines machines;
  f64 shock_penalty;
};

// profit_trend is the change in profit between the two most recent periods.
f64 motivation_target(const WorkforceParams& p, f64 wage, f64 benefits, f64 profit_trend);

WorkforceOutcome step_workforce(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in, Warnings& warnings);

}
