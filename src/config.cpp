#include "tailor/config.hpp"
#include "tailor/util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <cmath>
#include <limits>

namespace tailor {

static nlohmann::json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) die("cannot open config: " + path);
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    die("cannot parse config " + path + ": " + e.what());
  }
  if (!j.is_object()) die("config root must be an object: " + path);
  return j;
}

static const nlohmann::json& section(const nlohmann::json& j, const char* key) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (!j.contains(key)) return empty;
  if (!j.at(key).is_object()) die(std::string("config section must be an object: ") + key);
  return j.at(key);
}

template <typename T>
static void read_opt(const nlohmann::json& s, const char* key, T& out) {
  if (!s.contains(key)) return;
  try {
    out = s.at(key).get<T>();
  } catch (const nlohmann::json::type_error&) {
    die(std::string("invalid config value: ") + key);
  }
}

// Counts must be whole numbers; 8.7 workers is a config error, not 8.
static void read_opt(const nlohmann::json& s, const char* key, i32& out) {
  if (!s.contains(key)) return;
  const auto& v = s.at(key);
  if (v.is_number_integer()) {
    const i64 x = v.get<i64>();
    if (x < (i64)std::numeric_limits<i32>::min() || x > (i64)std::numeric_limits<i32>::max())
      die(std::string("config integer out of range: ") + key);
    out = (i32)x;
    return;
  }
  if (v.is_number_float()) {
    const f64 x = v.get<f64>();
    if (std::isfinite(x) && std::floor(x) == x && std::abs(x) <= (f64)std::numeric_limits<i32>::max()) {
      out = (i32)x;
      return;
    }
  }
  die(std::string("config value must be an integer: ") + key);
}

static Vec read_vec(const nlohmann::json& j, const char* key, const Vec& fallback) {
  if (!j.contains(key)) return fallback;
  if (!j.at(key).is_array()) die(std::string("missing/invalid array: ") + key);
  Vec v;
  for (const auto& x : j.at(key)) {
    if (!x.is_number()) die(std::string("non-numeric entry in: ") + key);
    v.push_back(x.get<f64>());
  }
  return v;
}

ShopConfig default_config() {
  ShopConfig cfg{};

  cfg.run.horizon = 0;

  auto& ini = cfg.initial;
  ini.cash = 165775.0;
  ini.material_stock = 16.0;
  ini.finished_stock = 81.0;
  ini.storage_capacity = 2000.0;
  ini.workers = 8;
  ini.motivation = 58.0;
  ini.wage = 1080.0;
  ini.worker_benefits = 0.0;
  ini.machines = 10;
  ini.wear = 6.0;
  ini.maintenance_backlog = 0.0;
  ini.price = 52.0;
  ini.advertising = 2800.0;
  ini.maintenance = 1200.0;
  ini.awareness = 767.0;
  ini.material_price = 4.0;
  ini.outlets = 0;
  ini.location = 0;

  auto& lim = cfg.limits;
  lim.price_max = 100.0;
  lim.material_purchase_max = 5000.0;
  lim.advertising_max = 10000.0;
  lim.wage_max = 5000.0;
  lim.benefits_max = 500.0;
  lim.hire_max = 20;
  lim.workers_max = 40;
  lim.machine_purchase_max = 10;
  lim.machines_max = 40;
  lim.maintenance_max = 5000.0;
  lim.outlets_max = 10;
  lim.use_steps = false;
  lim.price_step = 2.0;
  lim.material_purchase_step = 50.0;
  lim.advertising_step = 100.0;
  lim.wage_step = 100.0;
  lim.benefits_step = 10.0;
  lim.maintenance_step = 100.0;

  auto& wf = cfg.workforce;
  wf.neutral_motivation = 50.0;
  wf.reference_wage = 1000.0;
  wf.wage_sensitivity = 0.1;
  wf.benefits_sensitivity = 0.06875;
  wf.profit_trend_weight = 10.0;
  wf.profit_trend_scale = 10000.0;
  wf.adjust_rate = 0.5;
  wf.shock_threshold = 3;
  wf.shock_penalty = 2.0;

  auto& mc = cfg.machines;
  mc.base_wear = 10.0;
  mc.wear_retention = 0.9;
  mc.usage_wear = 0.02;
  mc.backlog_wear = 0.01;
  mc.maintenance_efficiency = 0.034;
  mc.maintenance_per_machine = 100.0;

  auto& pr = cfg.production;
  pr.output_per_worker = 50.0;
  pr.output_per_machine = 50.0;
  pr.motivation_scale = 0.017;
  pr.wear_penalty = 1.0;
  pr.material_per_unit = 1.0;

  auto& dm = cfg.demand;
  dm.base_demand = 280.0;
  dm.awareness_weight = 0.5;
  dm.awareness_max = 2000.0;
  dm.awareness_decay = 0.5;
  dm.advertising_effect_max = 900.0;
  dm.advertising_saturation = 4500.0;
  dm.outlet_awareness = 100.0;
  dm.location_awareness = 0.1;
  dm.elasticity_scale = 1.25;
  dm.elasticity_width = 4250.0;

  auto& fn = cfg.finance;
  fn.machine_price = 10000.0;
  fn.resale_fraction = 0.8;
  fn.storage_cost_finished = 0.0;
  fn.storage_cost_material = 0.0;
  fn.outlet_price = 10000.0;
  fn.outlet_resale_fraction = 0.8;
  fn.outlet_depreciation = 100.0;
  fn.outlet_rent = 500.0;
  fn.location_rents = {0, 0, 0};
  fn.positive_interest = 0.0;
  fn.negative_interest = 0.0;
  fn.credit_scale = 100000.0;
  fn.credit_floor = 0.1;
  fn.material_value = 2.0;
  fn.finished_value = 20.0;
  fn.material_price_schedule = {8, 5, 5, 6, 5, 7, 7, 8, 8, 3, 5, 6, 8, 3};

  return cfg;
}

ShopConfig load_config(const std::string& path) {
  auto j = read_json_file(path);
  ShopConfig cfg = default_config();

  const auto& run = section(j, "run");
  read_opt(run, "horizon", cfg.run.horizon);

  const auto& ini = section(j, "initial");
  read_opt(ini, "cash", cfg.initial.cash);
  read_opt(ini, "material_stock", cfg.initial.material_stock);
  read_opt(ini, "finished_stock", cfg.initial.finished_stock);
  read_opt(ini, "storage_capacity", cfg.initial.storage_capacity);
  read_opt(ini, "workers", cfg.initial.workers);
  read_opt(ini, "motivation", cfg.initial.motivation);
  read_opt(ini, "wage", cfg.initial.wage);
  read_opt(ini, "worker_benefits", cfg.initial.worker_benefits);
  read_opt(ini, "machines", cfg.initial.machines);
  read_opt(ini, "wear", cfg.initial.wear);
  read_opt(ini, "maintenance_backlog", cfg.initial.maintenance_backlog);
  read_opt(ini, "price", cfg.initial.price);
  read_opt(ini, "advertising", cfg.initial.advertising);
  read_opt(ini, "maintenance", cfg.initial.maintenance);
  read_opt(ini, "awareness", cfg.initial.awareness);
  read_opt(ini, "material_price", cfg.initial.material_price);
  read_opt(ini, "outlets", cfg.initial.outlets);
  read_opt(ini, "location", cfg.initial.location);

  const auto& lim = section(j, "limits");
  read_opt(lim, "price_max", cfg.limits.price_max);
  read_opt(lim, "material_purchase_max", cfg.limits.material_purchase_max);
  read_opt(lim, "advertising_max", cfg.limits.advertising_max);
  read_opt(lim, "wage_max", cfg.limits.wage_max);
  read_opt(lim, "benefits_max", cfg.limits.benefits_max);
  read_opt(lim, "hire_max", cfg.limits.hire_max);
  read_opt(lim, "workers_max", cfg.limits.workers_max);
  read_opt(lim, "machine_purchase_max", cfg.limits.machine_purchase_max);
  read_opt(lim, "machines_max", cfg.limits.machines_max);
  read_opt(lim, "maintenance_max", cfg.limits.maintenance_max);
  read_opt(lim, "outlets_max", cfg.limits.outlets_max);
  read_opt(lim, "use_steps", cfg.limits.use_steps);
  read_opt(lim, "price_step", cfg.limits.price_step);
  read_opt(lim, "material_purchase_step", cfg.limits.material_purchase_step);
  read_opt(lim, "advertising_step", cfg.limits.advertising_step);
  read_opt(lim, "wage_step", cfg.limits.wage_step);
  read_opt(lim, "benefits_step", cfg.limits.benefits_step);
  read_opt(lim, "maintenance_step", cfg.limits.maintenance_step);

  const auto& wf = section(j, "workforce");
  read_opt(wf, "neutral_motivation", cfg.workforce.neutral_motivation);
  read_opt(wf, "reference_wage", cfg.workforce.reference_wage);
  read_opt(wf, "wage_sensitivity", cfg.workforce.wage_sensitivity);
  read_opt(wf, "benefits_sensitivity", cfg.workforce.benefits_sensitivity);
  read_opt(wf, "profit_trend_weight", cfg.workforce.profit_trend_weight);
  read_opt(wf, "profit_trend_scale", cfg.workforce.profit_trend_scale);
  read_opt(wf, "adjust_rate", cfg.workforce.adjust_rate);
  read_opt(wf, "shock_threshold", cfg.workforce.shock_threshold);
  read_opt(wf, "shock_penalty", cfg.workforce.shock_penalty);

  const auto& mc = section(j, "machines");
  read_opt(mc, "base_wear", cfg.machines.base_wear);
  read_opt(mc, "wear_retention", cfg.machines.wear_retention);
  read_opt(mc, "usage_wear", cfg.machines.usage_wear);
  read_opt(mc, "backlog_wear", cfg.machines.backlog_wear);
  read_opt(mc, "maintenance_efficiency", cfg.machines.maintenance_efficiency);
  read_opt(mc, "maintenance_per_machine", cfg.machines.maintenance_per_machine);

  const auto& pr = section(j, "production");
  read_opt(pr, "output_per_worker", cfg.production.output_per_worker);
  read_opt(pr, "output_per_machine", cfg.production.output_per_machine);
  read_opt(pr, "motivation_scale", cfg.production.motivation_scale);
  read_opt(pr, "wear_penalty", cfg.production.wear_penalty);
  read_opt(pr, "material_per_unit", cfg.production.material_per_unit);

  const auto& dm = section(j, "demand");
  read_opt(dm, "base_demand", cfg.demand.base_demand);
  read_opt(dm, "awareness_weight", cfg.demand.awareness_weight);
  read_opt(dm, "awareness_max", cfg.demand.awareness_max);
  read_opt(dm, "awareness_decay", cfg.demand.awareness_decay);
  read_opt(dm, "advertising_effect_max", cfg.demand.advertising_effect_max);
  read_opt(dm, "advertising_saturation", cfg.demand.advertising_saturation);
  read_opt(dm, "outlet_awareness", cfg.demand.outlet_awareness);
  read_opt(dm, "location_awareness", cfg.demand.location_awareness);
  read_opt(dm, "elasticity_scale", cfg.demand.elasticity_scale);
  read_opt(dm, "elasticity_width", cfg.demand.elasticity_width);

  const auto& fn = section(j, "finance");
  read_opt(fn, "machine_price", cfg.finance.machine_price);
  read_opt(fn, "resale_fraction", cfg.finance.resale_fraction);
  read_opt(fn, "storage_cost_finished", cfg.finance.storage_cost_finished);
  read_opt(fn, "storage_cost_material", cfg.finance.storage_cost_material);
  read_opt(fn, "outlet_price", cfg.finance.outlet_price);
  read_opt(fn, "outlet_resale_fraction", cfg.finance.outlet_resale_fraction);
  read_opt(fn, "outlet_depreciation", cfg.finance.outlet_depreciation);
  read_opt(fn, "outlet_rent", cfg.finance.outlet_rent);
  cfg.finance.location_rents = read_vec(fn, "location_rents", cfg.finance.location_rents);
  read_opt(fn, "positive_interest", cfg.finance.positive_interest);
  read_opt(fn, "negative_interest", cfg.finance.negative_interest);
  read_opt(fn, "credit_scale", cfg.finance.credit_scale);
  read_opt(fn, "credit_floor", cfg.finance.credit_floor);
  read_opt(fn, "material_value", cfg.finance.material_value);
  read_opt(fn, "finished_value", cfg.finance.finished_value);
  cfg.finance.material_price_schedule = read_vec(fn, "material_price_schedule", cfg.finance.material_price_schedule);

  return cfg;
}

static void require_cfg_nonneg(double x, const char* name) {
  if (!is_finite(x) || x < 0.0) die(std::string(name) + " must be finite and >= 0");
}

static void require_cfg_unit(double x, const char* name) {
  if (!(x >= 0.0 && x <= 1.0)) die(std::string(name) + " must be in [0,1]");
}

void validate_config(const ShopConfig& cfg) {
  if (cfg.run.horizon < 0) die("run.horizon must be >= 0");

  const auto& ini = cfg.initial;
  if (!is_finite(ini.cash)) die("initial.cash has NaN/Inf");
  require_cfg_nonneg(ini.material_stock, "initial.material_stock");
  require_cfg_nonneg(ini.finished_stock, "initial.finished_stock");
  require_cfg_nonneg(ini.storage_capacity, "initial.storage_capacity");
  if (ini.finished_stock > ini.storage_capacity) die("initial.finished_stock exceeds storage_capacity");
  if (ini.workers < 0) die("initial.workers must be >= 0");
  if (ini.machines < 0) die("initial.machines must be >= 0");
  if (!(ini.motivation >= INDEX_MIN && ini.motivation <= INDEX_MAX)) die("initial.motivation must be in [0,100]");
  if (!(ini.wear >= INDEX_MIN && ini.wear <= INDEX_MAX)) die("initial.wear must be in [0,100]");
  require_cfg_nonneg(ini.wage, "initial.wage");
  require_cfg_nonneg(ini.worker_benefits, "initial.worker_benefits");
  if (ini.outlets < 0) die("initial.outlets must be >= 0");
  if (ini.location < 0 || (std::size_t)ini.location >= cfg.finance.location_rents.size())
    die("initial.location must index finance.location_rents");
  require_cfg_nonneg(ini.maintenance_backlog, "initial.maintenance_backlog");
  require_cfg_nonneg(ini.price, "initial.price");
  require_cfg_nonneg(ini.advertising, "initial.advertising");
  require_cfg_nonneg(ini.maintenance, "initial.maintenance");
  require_cfg_nonneg(ini.material_price, "initial.material_price");
  if (!(ini.awareness >= 0.0 && ini.awareness <= cfg.demand.awareness_max)) die("initial.awareness must be in [0,awareness_max]");

  const auto& lim = cfg.limits;
  require_cfg_nonneg(lim.price_max, "limits.price_max");
  require_cfg_nonneg(lim.material_purchase_max, "limits.material_purchase_max");
  require_cfg_nonneg(lim.advertising_max, "limits.advertising_max");
  require_cfg_nonneg(lim.wage_max, "limits.wage_max");
  require_cfg_nonneg(lim.maintenance_max, "limits.maintenance_max");
  require_cfg_nonneg(lim.benefits_max, "limits.benefits_max");
  if (lim.outlets_max < ini.outlets) die("limits.outlets_max must be >= initial.outlets");
  if (lim.hire_max < 0) die("limits.hire_max must be >= 0");
  if (lim.workers_max < ini.workers) die("limits.workers_max must be >= initial.workers");
  if (lim.machine_purchase_max < 0) die("limits.machine_purchase_max must be >= 0");
  if (lim.machines_max < ini.machines) die("limits.machines_max must be >= initial.machines");
  if (lim.use_steps) {
    if (!(lim.price_step > 0.0 && lim.material_purchase_step > 0.0 && lim.advertising_step > 0.0 &&
          lim.wage_step > 0.0 && lim.benefits_step > 0.0 && lim.maintenance_step > 0.0))
      die("limits steps must be > 0 when use_steps is set");
  }

  const auto& wf = cfg.workforce;
  if (!(wf.neutral_motivation >= INDEX_MIN && wf.neutral_motivation <= INDEX_MAX)) die("workforce.neutral_motivation must be in [0,100]");
  require_cfg_nonneg(wf.reference_wage, "workforce.reference_wage");
  require_cfg_nonneg(wf.wage_sensitivity, "workforce.wage_sensitivity");
  require_cfg_nonneg(wf.benefits_sensitivity, "workforce.benefits_sensitivity");
  require_cfg_nonneg(wf.profit_trend_weight, "workforce.profit_trend_weight");
  if (!(wf.profit_trend_scale > 0.0)) die("workforce.profit_trend_scale must be > 0");
  require_cfg_unit(wf.adjust_rate, "workforce.adjust_rate");
  if (wf.shock_threshold < 0) die("workforce.shock_threshold must be >= 0");
  require_cfg_nonneg(wf.shock_penalty, "workforce.shock_penalty");

  const auto& mc = cfg.machines;
  require_cfg_nonneg(mc.base_wear, "machines.base_wear");
  require_cfg_unit(mc.wear_retention, "machines.wear_retention");
  require_cfg_nonneg(mc.usage_wear, "machines.usage_wear");
  require_cfg_nonneg(mc.backlog_wear, "machines.backlog_wear");
  require_cfg_nonneg(mc.maintenance_efficiency, "machines.maintenance_efficiency");
  require_cfg_nonneg(mc.maintenance_per_machine, "machines.maintenance_per_machine");

  const auto& pr = cfg.production;
  require_cfg_nonneg(pr.output_per_worker, "production.output_per_worker");
  require_cfg_nonneg(pr.output_per_machine, "production.output_per_machine");
  require_cfg_nonneg(pr.motivation_scale, "production.motivation_scale");
  require_cfg_unit(pr.wear_penalty, "production.wear_penalty");
  if (!(pr.material_per_unit > 0.0)) die("production.material_per_unit must be > 0");

  const auto& dm = cfg.demand;
  require_cfg_nonneg(dm.base_demand, "demand.base_demand");
  require_cfg_nonneg(dm.awareness_weight, "demand.awareness_weight");
  if (!(dm.awareness_max > 0.0)) die("demand.awareness_max must be > 0");
  require_cfg_unit(dm.awareness_decay, "demand.awareness_decay");
  require_cfg_nonneg(dm.advertising_effect_max, "demand.advertising_effect_max");
  if (!(dm.advertising_saturation > 0.0)) die("demand.advertising_saturation must be > 0");
  require_cfg_nonneg(dm.outlet_awareness, "demand.outlet_awareness");
  require_cfg_nonneg(dm.location_awareness, "demand.location_awareness");
  require_cfg_nonneg(dm.elasticity_scale, "demand.elasticity_scale");
  if (!(dm.elasticity_width > 0.0)) die("demand.elasticity_width must be > 0");

  const auto& fn = cfg.finance;
  require_cfg_nonneg(fn.machine_price, "finance.machine_price");
  require_cfg_unit(fn.resale_fraction, "finance.resale_fraction");
  require_cfg_nonneg(fn.storage_cost_finished, "finance.storage_cost_finished");
  require_cfg_nonneg(fn.storage_cost_material, "finance.storage_cost_material");
  require_cfg_nonneg(fn.outlet_price, "finance.outlet_price");
  require_cfg_unit(fn.outlet_resale_fraction, "finance.outlet_resale_fraction");
  require_cfg_nonneg(fn.outlet_depreciation, "finance.outlet_depreciation");
  require_cfg_nonneg(fn.outlet_rent, "finance.outlet_rent");
  if (fn.location_rents.empty()) die("finance.location_rents must not be empty");
  for (auto r : fn.location_rents) require_cfg_nonneg(r, "finance.location_rents entry");
  require_cfg_nonneg(fn.positive_interest, "finance.positive_interest");
  require_cfg_nonneg(fn.negative_interest, "finance.negative_interest");
  if (!(fn.credit_scale > 0.0)) die("finance.credit_scale must be > 0");
  if (!(fn.credit_floor > 0.0 && fn.credit_floor <= 1.0)) die("finance.credit_floor must be in (0,1]");
  require_cfg_nonneg(fn.material_value, "finance.material_value");
  require_cfg_nonneg(fn.finished_value, "finance.finished_value");
  if (fn.material_price_schedule.empty()) die("finance.material_price_schedule must not be empty");
  for (auto p : fn.material_price_schedule) require_cfg_nonneg(p, "finance.material_price_schedule entry");
}

}
