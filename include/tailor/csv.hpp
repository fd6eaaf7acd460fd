#pragma once
#include <fstream>
#include <string>
#include <vector>
#include "tailor/types.hpp"
#include "tailor/state.hpp"

namespace tailor {

struct CsvWriter {
  std::ofstream out;

  explicit CsvWriter(const std::string& path);
  void write_header();
  void write_row_from_state(const ShopState& st);
  void write_history(const std::vector<ShopState>& history);
};

}
