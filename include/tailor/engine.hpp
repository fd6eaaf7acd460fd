#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "tailor/config.hpp"
#include "tailor/state.hpp"
#include "tailor/inputs.hpp"

namespace tailor {

struct StepResult {
  ShopState state;
  ControllableInputs applied;
  Warnings warnings;
};

// One period: clamp inputs, then workforce/machines, production, sales, finance.
// Pure; throws InvalidInputError for non-finite inputs.
StepResult step_state(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in);

class Engine;

// The only way to start a run: validates the configuration and the initial state.
Engine init_engine(const ShopConfig& cfg);

// Owns the current state and the append-only history of one run.
// Not synchronized: a multi-threaded host serializes advance() itself.
// A positive run.horizon closes the run once that period has been simulated.
class Engine {
public:
  StepResult advance(const ControllableInputs& in);
  StepResult advance(const nlohmann::json& j);
  StepResult preview(const ControllableInputs& in) const;

  void close();
  bool closed() const;

  const ShopConfig& config() const;
  const ShopState& current() const;
  const std::vector<ShopState>& history() const;
  const ControllableInputs& last_inputs() const;

private:
  explicit Engine(const ShopConfig& cfg);
  friend Engine init_engine(const ShopConfig& cfg);

  ShopConfig cfg;
  std::vector<ShopState> states;
  ControllableInputs last;
  bool is_closed;
};

}
