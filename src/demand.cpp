#include "tailor/demand.hpp"
#include "tailor/util.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace tailor {

f64 advertising_effect(const DemandParams& p, f64 advertising) {
  return p.advertising_effect_max * (1.0 - std::exp(-clamp_min(advertising, 0.0) / p.advertising_saturation));
}

f64 next_awareness(const DemandParams& p, f64 awareness, f64 advertising, i32 outlets, i32 location) {
  const f64 kept = (1.0 - p.awareness_decay) * awareness;
  const f64 presence = advertising_effect(p, advertising) + p.outlet_awareness * (f64)std::max<i32>(outlets, 0);
  const f64 reach = 1.0 + p.location_awareness * (f64)location;
  return clamp_to(kept + reach * presence, 0.0, p.awareness_max);
}

f64 demand_at(const DemandParams& p, f64 price, f64 awareness) {
  if (!(price > 0.0)) return 0.0;
  const f64 base = p.base_demand + p.awareness_weight * awareness;
  const f64 elasticity = p.elasticity_scale * std::exp(-(price * price) / p.elasticity_width);
  return std::floor(clamp_min(base * elasticity, 0.0));
}

SalesOutcome step_sales(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                        const ProductionOutcome& prod, Warnings& warnings) {
  const auto& p = cfg.demand;
  SalesOutcome out{};

  const i32 outlets = prev.commercial.outlets + in.outlet_delta;
  out.awareness = next_awareness(p, prev.commercial.awareness, in.advertising, outlets, prev.commercial.location);
  out.demand = demand_at(p, in.price, out.awareness);

  const f64 available = prod.finished_stock;
  out.units_sold = std::min(out.demand, available);
  out.lost_sales = out.demand - out.units_sold;
  out.finished_stock = clamp_min(available - out.units_sold, 0.0);

  if (out.lost_sales > 0.0) {
    std::ostringstream os;
    os << out.lost_sales << " units of demand unmet, " << available << " in stock";
    warnings.push_back(Warning{WarningKind::LostSales, os.str()});
  }
  return out;
}

}
