#pragma once
#include "tailor/config.hpp"
#include "tailor/state.hpp"
#include "tailor/inputs.hpp"
#include "tailor/workforce.hpp"
#include "tailor/demand.hpp"

namespace tailor {

struct FinanceOutcome {
  Financial financial;
  f64 next_material_price;
};

// Cost (positive) or refund (negative) of buying or selling machines at the given wear.
f64 machine_trade(const FinanceParams& p, i32 delta, f64 wear);
// Outlets lose a fixed amount of value per elapsed period, never below zero.
f64 outlet_book_value(const FinanceParams& p, i32 period);
// Cost (positive) or refund (negative) of opening or closing outlets in the given period.
// Closing refunds resale_fraction of the list price less the elapsed depreciation.
f64 outlet_trade(const FinanceParams& p, i32 delta, i32 period);
f64 credit_factor_for(const FinanceParams& p, f64 cash);

FinanceOutcome step_finance(const ShopConfig& cfg, const ShopState& prev, const ControllableInputs& in,
                            const WorkforceOutcome& wf, const SalesOutcome& sales, Warnings& warnings);

}
