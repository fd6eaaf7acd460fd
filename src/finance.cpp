#include "tailor/finance.hpp"
#include "tailor/util.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace tailor {

f64 machine_trade(const FinanceParams& p, i32 delta, f64 wear) {
  if (delta > 0) return (f64)delta * p.machine_price;
  const f64 condition = 1.0 - wear / INDEX_MAX;
  return (f64)delta * p.resale_fraction * p.machine_price * condition;
}

f64 outlet_book_value(const FinanceParams& p, i32 period) {
  return clamp_min(p.outlet_price - p.outlet_depreciation * (f64)period, 0.0);
}

f64 outlet_trade(const FinanceParams& p, i32 delta, i32 period) {
  if (delta > 0) return (f64)delta * p.outlet_price;
  const f64 resale = clamp_min(p.outlet_resale_fraction * p.outlet_price - p.outlet_depreciation * (f64)period, 0.0);
  return (f64)delta * resale;
}

f64 credit_factor_for(const FinanceParams& p, f64 cash) {
  if (cash >= 0.0) return 1.0;
  return std::max(p.credit_floor, 1.0 - std::abs(cash) / p.credit_scale);
}

static CostBreakdown period_costs(const FinanceParams& p, const ShopState& prev, const ControllableInputs& in,
                                  const WorkforceOutcome& wf) {
  CostBreakdown c{};
  c.material = in.material_purchase * prev.commercial.material_price;
  c.wages = (f64)wf.workforce.workers * in.wage;
  c.benefits = (f64)wf.workforce.workers * in.worker_benefits;
  c.advertising = in.advertising;
  c.maintenance = in.maintenance;
  c.machine_trade = machine_trade(p, in.machine_delta, prev.machines.wear);
  c.outlet_trade = outlet_trade(p, in.outlet_delta, prev.period);
  c.storage = p.storage_cost_finished * prev.inventory.finished_stock
            + p.storage_cost_material * prev.inventory.material_stock;
  const i32 outlets = prev.commercial.outlets + in.outlet_delta;
  c.rent = p.location_rents[(std::size_t)prev.commercial.location] + (f64)outlets * p.outlet_rent;
  const f64 cash = prev.financial.cash;
  c.interest = (cash < 0.0) ? p.negative_interest * -cash : -p.positive_interest * cash;
  return c;
}

static f64 total(const CostBreakdown& c) {
  return c.material + c.wages + c.benefits + c.advertising + c.maintenance + c.machine_trade
       + c.outlet_trade + c.storage + c.rent + c.interest;
}

FinanceOutcome step_finance(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                            const WorkforceOutcome& wf, const SalesOutcome& sales, Warnings& warnings) {
  const auto& p = cfg.finance;
  FinanceOutcome out{};
  auto& f = out.financial;

  f.revenue = sales.units_sold * in.price;
  f.costs = period_costs(p, prev, in, wf);
  f.cost = total(f.costs);
  f.profit = f.revenue - f.cost;
  f.previous_profit = prev.financial.profit;
  f.cash = prev.financial.cash + f.profit;
  f.cumulative_profit = prev.financial.cumulative_profit + f.profit;
  f.credit_factor = credit_factor_for(p, f.cash);

  if (f.cash < 0.0) {
    std::ostringstream os;
    os << "cash balance " << f.cash << ", next purchase ceilings scaled by " << f.credit_factor;
    warnings.push_back(Warning{WarningKind::LowCash, os.str()});
  }

  const auto& schedule = p.material_price_schedule;
  out.next_material_price = schedule[(std::size_t)prev.period % schedule.size()];
  return out;
}

}
