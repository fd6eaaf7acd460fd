#include "tailor/invariants.hpp"
#include "tailor/util.hpp"

namespace tailor {

void check_invariants(const ShopConfig& cfg, const ShopState& st) {
  const int t = st.period;

  require_finite(st.inventory.material_stock, "inventory.material_stock", t);
  require_finite(st.inventory.finished_stock, "inventory.finished_stock", t);
  require_finite(st.workforce.motivation, "workforce.motivation", t);
  require_finite(st.workforce.wage, "workforce.wage", t);
  require_finite(st.workforce.benefits, "workforce.benefits", t);
  require_finite(st.machines.wear, "machines.wear", t);
  require_finite(st.machines.maintenance_backlog, "machines.maintenance_backlog", t);
  require_finite(st.production.capacity, "production.capacity", t);
  require_finite(st.production.units_produced, "production.units_produced", t);
  require_finite(st.commercial.price, "commercial.price", t);
  require_finite(st.commercial.awareness, "commercial.awareness", t);
  require_finite(st.commercial.demand, "commercial.demand", t);
  require_finite(st.commercial.units_sold, "commercial.units_sold", t);
  require_finite(st.financial.cash, "financial.cash", t);
  require_finite(st.financial.revenue, "financial.revenue", t);
  require_finite(st.financial.cost, "financial.cost", t);
  require_finite(st.financial.profit, "financial.profit", t);
  require_finite(st.financial.cumulative_profit, "financial.cumulative_profit", t);
  require_finite(st.financial.company_value, "financial.company_value", t);

  require_nonneg(st.inventory.material_stock, "inventory.material_stock", t);
  require_within(st.inventory.finished_stock, 0.0, st.inventory.storage_capacity, "inventory.finished_stock", t);
  require_nonneg((double)st.workforce.workers, "workforce.workers", t);
  require_nonneg((double)st.machines.machines, "machines.machines", t);
  require_within((double)st.commercial.outlets, 0.0, (double)cfg.limits.outlets_max, "commercial.outlets", t);
  require_within((double)st.commercial.location, 0.0, (double)cfg.finance.location_rents.size() - 1.0,
                 "commercial.location", t);
  require_nonneg(st.machines.maintenance_backlog, "machines.maintenance_backlog", t);

  require_within(st.workforce.motivation, INDEX_MIN, INDEX_MAX, "workforce.motivation", t);
  require_within(st.machines.wear, INDEX_MIN, INDEX_MAX, "machines.wear", t);
  require_within(st.commercial.awareness, 0.0, cfg.demand.awareness_max, "commercial.awareness", t);
  require_within(st.production.idle_ratio, 0.0, 1.0, "production.idle_ratio", t);
  require_within(st.financial.credit_factor, cfg.finance.credit_floor, 1.0, "financial.credit_factor", t);

  require_nonneg(st.production.units_produced, "production.units_produced", t);
  require_nonneg(st.production.capacity - st.production.units_produced, "production.capacity - units_produced", t);
  require_nonneg(st.production.material_limit - st.production.units_produced, "production.material_limit - units_produced", t);
  require_nonneg(st.commercial.units_sold, "commercial.units_sold", t);
  require_nonneg(st.commercial.lost_sales, "commercial.lost_sales", t);
}

}
