#pragma once
#include <string>
#include <vector>
#include "tailor/types.hpp"
#include "tailor/config.hpp"

namespace tailor {

enum class WarningKind {
  InputClamped,
  MaterialShortfall,
  LostSales,
  WorkforceDepleted,
  LowCash,
  StorageOverflow
};

const char* to_string(WarningKind kind);

struct Warning {
  WarningKind kind;
  std::string message;
};

using Warnings = std::vector<Warning>;

struct Inventory {
  f64 material_stock;
  f64 finished_stock;
  f64 storage_capacity;
};

struct Workforce {
  i32 workers;
  f64 motivation;
  f64 wage;
  f64 benefits;
};

struct Machines {
  i32 machines;
  f64 wear;
  f64 maintenance_backlog;
};

struct ProductionReport {
  f64 capacity;
  f64 material_limit;
  f64 units_produced;
  f64 overflow_discarded;
  f64 idle_ratio;
};

struct Commercial {
  f64 price;
  f64 advertising;
  f64 awareness;
  f64 demand;
  f64 units_sold;
  f64 lost_sales;
  f64 material_price;
  i32 outlets;
  i32 location;
};

struct CostBreakdown {
  f64 material;
  f64 wages;
  f64 benefits;
  f64 advertising;
  f64 maintenance;
  f64 machine_trade;
  f64 outlet_trade;
  f64 storage;
  f64 rent;
  // Net: charge on overdraft, negative (income) on a positive balance.
  f64 interest;
};

struct Financial {
  f64 cash;
  f64 revenue;
  f64 cost;
  CostBreakdown costs;
  f64 profit;
  f64 previous_profit;
  f64 cumulative_profit;
  f64 credit_factor;
  f64 company_value;
};

struct ShopState {
  i32 period;
  Inventory inventory;
  Workforce workforce;
  Machines machines;
  ProductionReport production;
  Commercial commercial;
  Financial financial;
  Warnings warnings;
};

ShopState make_initial_state(const ShopConfig& cfg);

f64 company_value(const ShopConfig& cfg, const ShopState& st);

}
