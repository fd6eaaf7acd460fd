#pragma once
#include <nlohmann/json.hpp>
#include "tailor/types.hpp"
#include "tailor/config.hpp"
#include "tailor/state.hpp"

namespace tailor {

struct ControllableInputs {
  f64 price;
  f64 material_purchase;
  f64 advertising;
  f64 wage;
  f64 worker_benefits;
  i32 hires;
  i32 machine_delta;
  i32 outlet_delta;
  f64 maintenance;
};

// Decisions that keep the documented starting business running unchanged.
ControllableInputs default_inputs(const ShopConfig& cfg);

// Throws InvalidInputError on a missing field, a wrong JSON type or a non-integer delta.
// worker_benefits and outlet_delta are optional and default to zero.
ControllableInputs parse_inputs(const nlohmann::json& j);
nlohmann::json to_json(const ControllableInputs& in);

// Throws InvalidInputError if any field is NaN or infinite.
void check_structure(const ControllableInputs& in);

// Clamps every field into its feasible range given the previous state
// (credit factor, current head- and machine counts) and records one
// InputClamped warning per adjusted field.
ControllableInputs clamp_inputs(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in, Warnings& warnings);

}
