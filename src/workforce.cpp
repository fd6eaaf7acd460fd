#include "tailor/workforce.hpp"
#include "tailor/util.hpp"
#include <algorithm>
#include <cstdlib>

namespace tailor {

f64 motivation_target(const WorkforceParams& p, f64 wage, f64 benefits, f64 profit_trend) {
  const f64 trend = clamp_to(safe_div(profit_trend, p.profit_trend_scale, 0.0), -1.0, 1.0);
  return p.neutral_motivation
       + p.wage_sensitivity * (wage - p.reference_wage)
       + p.benefits_sensitivity * benefits
       + p.profit_trend_weight * trend;
}

static Workforce update_workforce(const WorkforceParams& p, const ShopState& prev, const ControllableInputs& in, f64& penalty) {
  Workforce w{};
  w.workers = std::max<i32>(0, prev.workforce.workers + in.hires);
  w.wage = in.wage;
  w.benefits = in.worker_benefits;

  const i32 change = std::abs(in.hires);
  penalty = 0.0;
  if (change > p.shock_threshold) penalty = p.shock_penalty * (f64)(change - p.shock_threshold);

  const f64 m = prev.workforce.motivation;
  const f64 trend = prev.financial.profit - prev.financial.previous_profit;
  const f64 target = motivation_target(p, in.wage, in.worker_benefits, trend);
  const f64 moved = m + p.adjust_rate * (target - m) - penalty;
  w.motivation = clamp_to(moved, INDEX_MIN, INDEX_MAX);
  return w;
}

static Machines update_machines(const MachineParams& p, const ShopState& prev, const ControllableInputs& in) {
  Machines mc{};
  mc.machines = std::max<i32>(0, prev.machines.machines + in.machine_delta);

  // Production of this period is not known yet; wear follows last period's usage.
  const f64 intensity = safe_div(prev.production.units_produced, (f64)prev.machines.machines, 0.0);
  const f64 per_machine = (f64)std::max<i32>(mc.machines, 1);

  const f64 wear = p.base_wear
                 + p.wear_retention * prev.machines.wear
                 + p.usage_wear * intensity
                 + p.backlog_wear * prev.machines.maintenance_backlog / per_machine
                 - p.maintenance_efficiency * in.maintenance / per_machine;
  mc.wear = clamp_to(wear, INDEX_MIN, INDEX_MAX);

  const f64 owed = prev.machines.maintenance_backlog + (f64)mc.machines * p.maintenance_per_machine;
  mc.maintenance_backlog = clamp_min(owed - in.maintenance, 0.0);
  return mc;
}

WorkforceOutcome step_workforce(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in, Warnings& warnings) {
  WorkforceOutcome out{};
  out.workforce = update_workforce(cfg.workforce, prev, in, out.shock_penalty);
  out.machines = update_machines(cfg.machines, prev, in);

  if (prev.workforce.workers > 0 && out.workforce.workers == 0 && prev.commercial.demand > 0.0) {
    warnings.push_back(Warning{WarningKind::WorkforceDepleted,
                               "workforce reduced to zero while demand is " + std::to_string((long long)prev.commercial.demand)});
  }
  return out;
}

}
