#include "tailor/engine.hpp"
#include "tailor/errors.hpp"
#include "tailor/invariants.hpp"
#include "tailor/workforce.hpp"
#include "tailor/production.hpp"
#include "tailor/demand.hpp"
#include "tailor/finance.hpp"

namespace tailor {

static ShopState assemble(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                          const WorkforceOutcome& wf, const ProductionOutcome& prod,
                          const SalesOutcome& sales, const FinanceOutcome& fin) {
  ShopState next{};
  next.period = prev.period + 1;

  next.inventory.material_stock = prod.material_stock;
  next.inventory.finished_stock = sales.finished_stock;
  next.inventory.storage_capacity = prev.inventory.storage_capacity;

  next.workforce = wf.workforce;
  next.machines = wf.machines;
  next.production = prod.report;

  next.commercial.price = in.price;
  next.commercial.advertising = in.advertising;
  next.commercial.awareness = sales.awareness;
  next.commercial.demand = sales.demand;
  next.commercial.units_sold = sales.units_sold;
  next.commercial.lost_sales = sales.lost_sales;
  next.commercial.material_price = fin.next_material_price;
  next.commercial.outlets = prev.commercial.outlets + in.outlet_delta;
  next.commercial.location = prev.commercial.location;

  next.financial = fin.financial;
  next.financial.company_value = company_value(cfg, next);
  return next;
}

StepResult step_state(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in) {
  check_structure(in);

  StepResult r{};
  auto& w = r.warnings;

  r.applied = clamp_inputs(cfg, prev, in, w);
  const auto wf = step_workforce(cfg, prev, r.applied, w);
  const auto prod = step_production(cfg, prev, r.applied, wf, w);
  const auto sales = step_sales(cfg, prev, r.applied, prod, w);
  const auto fin = step_finance(cfg, prev, r.applied, wf, sales, w);

  r.state = assemble(cfg, prev, r.applied, wf, prod, sales, fin);
  r.state.warnings = w;
  return r;
}

Engine::Engine(const ShopConfig& cfg_)
  : cfg(cfg_), last(default_inputs(cfg_)), is_closed(false) {
  states.push_back(make_initial_state(cfg));
}

StepResult Engine::advance(const ControllableInputs& in) {
  if (is_closed) throw RunClosedError("run is closed at period " + std::to_string(current().period));

  auto r = step_state(cfg, states.back(), in);
  check_invariants(cfg, r.state);

  states.push_back(r.state);
  last = r.applied;
  if (cfg.run.horizon > 0 && r.state.period >= cfg.run.horizon) is_closed = true;
  return r;
}

StepResult Engine::advance(const nlohmann::json& j) {
  if (is_closed) throw RunClosedError("run is closed at period " + std::to_string(current().period));
  return advance(parse_inputs(j));
}

StepResult Engine::preview(const ControllableInputs& in) const {
  return step_state(cfg, states.back(), in);
}

void Engine::close() {
  is_closed = true;
}

bool Engine::closed() const {
  return is_closed;
}

const ShopConfig& Engine::config() const {
  return cfg;
}

const ShopState& Engine::current() const {
  return states.back();
}

const std::vector<ShopState>& Engine::history() const {
  return states;
}

const ControllableInputs& Engine::last_inputs() const {
  return last;
}

Engine init_engine(const ShopConfig& cfg) {
  validate_config(cfg);
  Engine engine(cfg);
  check_invariants(cfg, engine.current());
  return engine;
}

}
