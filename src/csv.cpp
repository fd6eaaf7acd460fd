#include "tailor/csv.hpp"
#include "tailor/util.hpp"
#include <filesystem>
#include <iomanip>

namespace tailor {

CsvWriter::CsvWriter(const std::string& path) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
  out.open(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) die("cannot open output csv: " + path);
  out.setf(std::ios::fixed);
  out << std::setprecision(4);
}

void CsvWriter::write_header() {
  out << "period,material_stock,finished_stock,workers,motivation,wage,benefits,machines,wear,maintenance_backlog,"
         "capacity,units_produced,overflow_discarded,idle_ratio,price,advertising,awareness,demand,units_sold,"
         "lost_sales,material_price,outlets,location,cash,revenue,cost,"
         "cost_material,cost_wages,cost_benefits,cost_advertising,cost_maintenance,cost_machine_trade,"
         "cost_outlet_trade,cost_storage,cost_rent,cost_interest,profit,cumulative_profit,credit_factor,company_value,warnings\n";
}

void CsvWriter::write_row_from_state(const ShopState& st) {
  out << st.period << ","
      << st.inventory.material_stock << "," << st.inventory.finished_stock << ","
      << st.workforce.workers << "," << st.workforce.motivation << "," << st.workforce.wage << ","
      << st.workforce.benefits << ","
      << st.machines.machines << "," << st.machines.wear << "," << st.machines.maintenance_backlog << ","
      << st.production.capacity << "," << st.production.units_produced << ","
      << st.production.overflow_discarded << "," << st.production.idle_ratio << ","
      << st.commercial.price << "," << st.commercial.advertising << "," << st.commercial.awareness << ","
      << st.commercial.demand << "," << st.commercial.units_sold << "," << st.commercial.lost_sales << ","
      << st.commercial.material_price << "," << st.commercial.outlets << "," << st.commercial.location << ","
      << st.financial.cash << "," << st.financial.revenue << "," << st.financial.cost << ",";
  const auto& c = st.financial.costs;
  out << c.material << "," << c.wages << "," << c.benefits << "," << c.advertising << ","
      << c.maintenance << "," << c.machine_trade << "," << c.outlet_trade << ","
      << c.storage << "," << c.rent << "," << c.interest << ","
      << st.financial.profit << "," << st.financial.cumulative_profit << ","
      << st.financial.credit_factor << "," << st.financial.company_value << ",";

  for (std::size_t i = 0; i < st.warnings.size(); ++i) {
    if (i > 0) out << ";";
    out << to_string(st.warnings[i].kind);
  }
  out << "\n";
}

void CsvWriter::write_history(const std::vector<ShopState>& history) {
  for (const auto& st : history) write_row_from_state(st);
  out.flush();
  if (!out) die("failed writing output csv");
}

}
