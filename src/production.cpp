#include "tailor/production.hpp"
#include "tailor/util.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace tailor {

f64 labour_capacity(const ProductionParams& p, const Workforce& w) {
  const f64 motivation_factor = std::sqrt(clamp_min(w.motivation * p.motivation_scale, 0.0));
  return (f64)w.workers * p.output_per_worker * motivation_factor;
}

f64 machine_capacity(const ProductionParams& p, const Machines& m) {
  const f64 condition = clamp_min(1.0 - p.wear_penalty * m.wear / INDEX_MAX, 0.0);
  return (f64)m.machines * p.output_per_machine * condition;
}

f64 effective_capacity(const ProductionParams& p, const Workforce& w, const Machines& m) {
  return std::floor(std::min(labour_capacity(p, w), machine_capacity(p, m)));
}

ProductionOutcome step_production(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                                  const WorkforceOutcome& wf, Warnings& warnings) {
  const auto& p = cfg.production;
  ProductionOutcome out{};

  const f64 capacity = effective_capacity(p, wf.workforce, wf.machines);
  const f64 material = prev.inventory.material_stock + in.material_purchase;
  const f64 material_limit = std::floor(safe_div(material, p.material_per_unit, 0.0));
  const f64 produced = std::min(capacity, material_limit);

  if (produced < capacity) {
    std::ostringstream os;
    os << "material allows " << produced << " of " << capacity << " units of capacity";
    warnings.push_back(Warning{WarningKind::MaterialShortfall, os.str()});
  }

  out.material_stock = clamp_min(material - produced * p.material_per_unit, 0.0);

  const f64 storage = prev.inventory.storage_capacity;
  const f64 stocked = prev.inventory.finished_stock + produced;
  f64 overflow = 0.0;
  if (stocked > storage) {
    overflow = stocked - storage;
    std::ostringstream os;
    os << overflow << " finished units discarded, storage holds " << storage;
    warnings.push_back(Warning{WarningKind::StorageOverflow, os.str()});
  }
  out.finished_stock = std::min(stocked, storage);

  out.report.capacity = capacity;
  out.report.material_limit = material_limit;
  out.report.units_produced = produced;
  out.report.overflow_discarded = overflow;
  out.report.idle_ratio = safe_div(capacity - produced, capacity, 0.0);
  return out;
}

}
