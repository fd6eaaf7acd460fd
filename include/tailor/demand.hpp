#pragma once
#include "tailor/config.hpp"
#include "tailor/state.hpp"
#include "tailor/inputs.hpp"
#include "tailor/production.hpp"

namespace tailor {

struct SalesOutcome {
  f64 awareness;
  f64 demand;
  f64 units_sold;
  f64 lost_sales;
  f64 finished_stock;
};

f64 advertising_effect(const DemandParams& p, f64 advertising);
// Outlets add a fixed presence per outlet; a better location amplifies both
// the advertising and the outlet contribution.
f64 next_awareness(const DemandParams& p, f64 awareness, f64 advertising, i32 outlets, i32 location);
// Whole units demanded; a price of zero offers nothing for sale.
f64 demand_at(const DemandParams& p, f64 price, f64 awareness);

SalesOutcome step_sales(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                        const ProductionOutcome& prod, Warnings& warnings);

}
