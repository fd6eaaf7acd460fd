#include "tailor/inputs.hpp"
#include "tailor/errors.hpp"
#include "tailor/util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace tailor {

static const char* const FIELDS[] = {
  "price", "material_purchase", "advertising", "wage", "hires", "machine_delta", "maintenance"
};

ControllableInputs default_inputs(const ShopConfig& cfg) {
  ControllableInputs in{};
  in.price = cfg.initial.price;
  in.material_purchase = 0.0;
  in.advertising = cfg.initial.advertising;
  in.wage = cfg.initial.wage;
  in.worker_benefits = cfg.initial.worker_benefits;
  in.hires = 0;
  in.machine_delta = 0;
  in.outlet_delta = 0;
  in.maintenance = cfg.initial.maintenance;
  return in;
}

static f64 read_number(const nlohmann::json& j, const char* key) {
  const auto& v = j.at(key);
  if (!v.is_number()) throw InvalidInputError(std::string("field is not a number: ") + key);
  return v.get<f64>();
}

static i32 read_integer(const nlohmann::json& j, const char* key) {
  const auto& v = j.at(key);
  if (v.is_number_integer()) {
    const i64 x = v.get<i64>();
    if (x < (i64)std::numeric_limits<i32>::min() || x > (i64)std::numeric_limits<i32>::max())
      throw InvalidInputError(std::string("integer field out of representable range: ") + key);
    return (i32)x;
  }
  if (v.is_number_float()) {
    const f64 x = v.get<f64>();
    if (std::isfinite(x) && std::floor(x) == x && std::abs(x) <= (f64)std::numeric_limits<i32>::max()) return (i32)x;
  }
  throw InvalidInputError(std::string("field is not an integer: ") + key);
}

ControllableInputs parse_inputs(const nlohmann::json& j) {
  if (!j.is_object()) throw InvalidInputError("inputs must be a JSON object");
  for (const char* f : FIELDS) {
    if (!j.contains(f)) throw InvalidInputError(std::string("missing field: ") + f);
  }

  ControllableInputs in{};
  in.price = read_number(j, "price");
  in.material_purchase = read_number(j, "material_purchase");
  in.advertising = read_number(j, "advertising");
  in.wage = read_number(j, "wage");
  in.worker_benefits = j.contains("worker_benefits") ? read_number(j, "worker_benefits") : 0.0;
  in.hires = read_integer(j, "hires");
  in.machine_delta = read_integer(j, "machine_delta");
  in.outlet_delta = j.contains("outlet_delta") ? read_integer(j, "outlet_delta") : 0;
  in.maintenance = read_number(j, "maintenance");

  check_structure(in);
  return in;
}

nlohmann::json to_json(const ControllableInputs& in) {
  return nlohmann::json{
    {"price", in.price},
    {"material_purchase", in.material_purchase},
    {"advertising", in.advertising},
    {"wage", in.wage},
    {"worker_benefits", in.worker_benefits},
    {"hires", in.hires},
    {"machine_delta", in.machine_delta},
    {"outlet_delta", in.outlet_delta},
    {"maintenance", in.maintenance}
  };
}

void check_structure(const ControllableInputs& in) {
  if (!is_finite(in.price)) throw InvalidInputError("price is not finite");
  if (!is_finite(in.material_purchase)) throw InvalidInputError("material_purchase is not finite");
  if (!is_finite(in.advertising)) throw InvalidInputError("advertising is not finite");
  if (!is_finite(in.wage)) throw InvalidInputError("wage is not finite");
  if (!is_finite(in.worker_benefits)) throw InvalidInputError("worker_benefits is not finite");
  if (!is_finite(in.maintenance)) throw InvalidInputError("maintenance is not finite");
}

static void note_clamp(Warnings& warnings, const char* field, f64 requested, f64 applied) {
  std::ostringstream os;
  os << field << " " << requested << " clamped to " << applied;
  warnings.push_back(Warning{WarningKind::InputClamped, os.str()});
}

static f64 clamp_field(const char* field, f64 x, f64 lo, f64 hi, bool stepped, f64 step, Warnings& warnings) {
  f64 y = clamp_to(x, lo, hi);
  if (stepped) y = clamp_min(step_down(y, step), lo);
  if (y != x) note_clamp(warnings, field, x, y);
  return y;
}

static i32 clamp_count(const char* field, i32 x, i32 lo, i32 hi, Warnings& warnings) {
  const i32 y = std::clamp(x, lo, std::max(lo, hi));
  if (y != x) note_clamp(warnings, field, (f64)x, (f64)y);
  return y;
}

ControllableInputs clamp_inputs(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in, Warnings& warnings) {
  const auto& lim = cfg.limits;
  const bool steps = lim.use_steps;
  const f64 credit = prev.financial.credit_factor;

  ControllableInputs out{};
  out.price = clamp_field("price", in.price, 0.0, lim.price_max, steps, lim.price_step, warnings);
  out.material_purchase = clamp_field("material_purchase", in.material_purchase, 0.0,
                                      lim.material_purchase_max * credit, steps, lim.material_purchase_step, warnings);
  out.advertising = clamp_field("advertising", in.advertising, 0.0, lim.advertising_max, steps, lim.advertising_step, warnings);
  out.wage = clamp_field("wage", in.wage, 0.0, lim.wage_max, steps, lim.wage_step, warnings);
  out.worker_benefits = clamp_field("worker_benefits", in.worker_benefits, 0.0, lim.benefits_max, steps,
                                    lim.benefits_step, warnings);
  out.maintenance = clamp_field("maintenance", in.maintenance, 0.0, lim.maintenance_max, steps, lim.maintenance_step, warnings);

  const i32 workers = prev.workforce.workers;
  const i32 hire_hi = std::min(lim.hire_max, lim.workers_max - workers);
  out.hires = clamp_count("hires", in.hires, -workers, hire_hi, warnings);

  const i32 machines = prev.machines.machines;
  const i32 buy_ceiling = (i32)std::floor((f64)lim.machine_purchase_max * credit);
  const i32 machine_hi = std::min(buy_ceiling, lim.machines_max - machines);
  out.machine_delta = clamp_count("machine_delta", in.machine_delta, -machines, machine_hi, warnings);

  const i32 outlets = prev.commercial.outlets;
  out.outlet_delta = clamp_count("outlet_delta", in.outlet_delta, -outlets, lim.outlets_max - outlets, warnings);

  return out;
}

}
