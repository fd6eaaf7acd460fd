#include "tailor/scenario.hpp"
#include "tailor/util.hpp"
#include <fstream>

namespace tailor {

static const char* const KNOWN[] = {
  "price", "material_purchase", "advertising", "wage", "worker_benefits", "hires", "machine_delta",
  "outlet_delta", "maintenance"
};

static bool known_field(const std::string& key) {
  for (const char* k : KNOWN) if (key == k) return true;
  return false;
}

Scenario load_scenario(const std::string& path, const ControllableInputs& base) {
  std::ifstream in(path);
  if (!in.is_open()) die("cannot open scenario: " + path);
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    die("cannot parse scenario " + path + ": " + e.what());
  }
  if (!j.is_object() || !j.contains("periods") || !j.at("periods").is_array())
    die("scenario must be an object with a 'periods' array: " + path);

  Scenario sc;
  nlohmann::json running = to_json(base);
  int idx = 0;
  for (const auto& patch : j.at("periods")) {
    if (!patch.is_object()) die("scenario period " + std::to_string(idx) + " is not an object");
    for (auto it = patch.begin(); it != patch.end(); ++it) {
      if (!known_field(it.key())) die("scenario period " + std::to_string(idx) + " has unknown field: " + it.key());
    }
    // Deltas apply once; they do not repeat in later periods.
    running["hires"] = 0;
    running["machine_delta"] = 0;
    running["outlet_delta"] = 0;
    running.merge_patch(patch);
    sc.periods.push_back(running);
    ++idx;
  }
  return sc;
}

}
