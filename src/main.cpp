#include <iostream>
#include <string>
#include "tailor/config.hpp"
#include "tailor/engine.hpp"
#include "tailor/errors.hpp"
#include "tailor/scenario.hpp"
#include "tailor/csv.hpp"
#include "tailor/fingerprint.hpp"

static void print_period(const tailor::StepResult& r) {
  const auto& st = r.state;
  std::cout << "period=" << st.period
            << " workers=" << st.workforce.workers
            << " machines=" << st.machines.machines
            << " produced=" << st.production.units_produced
            << " sold=" << st.commercial.units_sold
            << " stock=" << st.inventory.finished_stock
            << " material=" << st.inventory.material_stock
            << " cash=" << st.financial.cash
            << " profit=" << st.financial.profit
            << " value=" << st.financial.company_value << "\n";
  for (const auto& w : r.warnings) {
    std::cerr << "  warn period=" << st.period << " " << tailor::to_string(w.kind) << ": " << w.message << "\n";
  }
}

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/base.json";
  const std::string scenario_path = argc > 2 ? argv[2] : "config/scenario.json";
  const std::string out_path = argc > 3 ? argv[3] : "output/history.csv";

  auto cfg = tailor::load_config(config_path);
  auto engine = tailor::init_engine(cfg);
  auto scenario = tailor::load_scenario(scenario_path, engine.last_inputs());

  for (std::size_t i = 0; i < scenario.periods.size() && !engine.closed(); ++i) {
    try {
      print_period(engine.advance(scenario.periods[i]));
    } catch (const tailor::InvalidInputError& e) {
      std::cerr << "invalid decisions in scenario period " << i << ": " << e.what() << "\n";
      return 1;
    }
  }
  if (!engine.closed()) engine.close();

  tailor::CsvWriter writer(out_path);
  writer.write_header();
  writer.write_history(engine.history());

  const auto h = tailor::hash_history_fingerprint(engine.history());
  std::cout << "run_ok periods=" << engine.current().period << " hash=" << h << "\n";
  return 0;
}
