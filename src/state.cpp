#include "tailor/state.hpp"
#include "tailor/demand.hpp"
#include "tailor/finance.hpp"
#include "tailor/util.hpp"

namespace tailor {

const char* to_string(WarningKind kind) {
  switch (kind) {
    case WarningKind::InputClamped: return "input_clamped";
    case WarningKind::MaterialShortfall: return "material_shortfall";
    case WarningKind::LostSales: return "lost_sales";
    case WarningKind::WorkforceDepleted: return "workforce_depleted";
    case WarningKind::LowCash: return "low_cash";
    case WarningKind::StorageOverflow: return "storage_overflow";
  }
  return "unknown";
}

f64 company_value(const ShopConfig& cfg, const ShopState& st) {
  const auto& fn = cfg.finance;
  const f64 condition = 1.0 - st.machines.wear / INDEX_MAX;
  const f64 machine_value = (f64)st.machines.machines * fn.machine_price * condition;
  const f64 outlet_value = (f64)st.commercial.outlets * outlet_book_value(fn, st.period);
  return st.financial.cash + machine_value + outlet_value
       + fn.material_value * st.inventory.material_stock
       + fn.finished_value * st.inventory.finished_stock;
}

ShopState make_initial_state(const ShopConfig& cfg) {
  const auto& ini = cfg.initial;

  ShopState st{};
  st.period = 0;

  st.inventory.material_stock = ini.material_stock;
  st.inventory.finished_stock = ini.finished_stock;
  st.inventory.storage_capacity = ini.storage_capacity;

  st.workforce.workers = ini.workers;
  st.workforce.motivation = ini.motivation;
  st.workforce.wage = ini.wage;
  st.workforce.benefits = ini.worker_benefits;

  st.machines.machines = ini.machines;
  st.machines.wear = ini.wear;
  st.machines.maintenance_backlog = ini.maintenance_backlog;

  st.production = ProductionReport{};

  st.commercial.price = ini.price;
  st.commercial.advertising = ini.advertising;
  st.commercial.awareness = ini.awareness;
  st.commercial.demand = demand_at(cfg.demand, ini.price, ini.awareness);
  st.commercial.outlets = ini.outlets;
  st.commercial.location = ini.location;
  st.commercial.units_sold = 0.0;
  st.commercial.lost_sales = 0.0;
  st.commercial.material_price = ini.material_price;

  st.financial.cash = ini.cash;
  st.financial.revenue = 0.0;
  st.financial.cost = 0.0;
  st.financial.costs = CostBreakdown{};
  st.financial.profit = 0.0;
  st.financial.previous_profit = 0.0;
  st.financial.cumulative_profit = 0.0;
  st.financial.credit_factor = credit_factor_for(cfg.finance, ini.cash);
  st.financial.company_value = company_value(cfg, st);

  return st;
}

}
