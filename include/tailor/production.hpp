#pragma once
#include "tailor/config.hpp"
#include "tailor/state.hpp"
#include "tailor/inputs.hpp"
#include "tailor/workforce.hpp"

namespace tailor {

struct ProductionOutcome {
  ProductionReport report;
  f64 material_stock;
  f64 finished_stock;
};

f64 labour_capacity(const ProductionParams& p, const Workforce& w);
f64 machine_capacity(const ProductionParams& p, const Machines& m);
// Bottleneck of labour and machines, in whole units.
f64 effective_capacity(const ProductionParams& p, const Workforce& w, const Machines& m);

ProductionOutcome step_production(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                                  const WorkforceOutcome& wf, Warnings& warnings);

}
