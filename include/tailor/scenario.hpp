#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tailor/inputs.hpp"

namespace tailor {

// Scripted decisions, one complete record per period. Each period in the file
// only lists the fields that change; the rest carry over from the period before.
struct Scenario {
  std::vector<nlohmann::json> periods;
};

Scenario load_scenario(const std::string& path, const ControllableInputs& base);

}
