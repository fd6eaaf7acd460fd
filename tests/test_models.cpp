#include <cmath>

#include "require.hpp"
#include "tailor/config.hpp"
#include "tailor/constants.hpp"
#include "tailor/demand.hpp"
#include "tailor/finance.hpp"
#include "tailor/inputs.hpp"
#include "tailor/production.hpp"
#include "tailor/state.hpp"
#include "tailor/workforce.hpp"

using namespace tailor;

namespace {

WorkforceOutcome crew(i32 workers, f64 motivation, i32 machines, f64 wear) {
    WorkforceOutcome wf{};
    wf.workforce.workers = workers;
    wf.workforce.motivation = motivation;
    wf.workforce.wage = 1000.0;
    wf.machines.machines = machines;
    wf.machines.wear = wear;
    return wf;
}

// Motivation factor of exactly 1 at motivation 100.
ShopConfig unit_motivation_config() {
    auto cfg = default_config();
    cfg.production.motivation_scale = 0.01;
    return cfg;
}

void hiring_shock_costs_motivation() {
    const auto cfg = default_config();
    const auto st = make_initial_state(cfg);
    auto calm = default_inputs(cfg);
    auto shock = calm;
    shock.hires = 10;

    Warnings ws;
    const auto a = step_workforce(cfg, st, calm, ws);
    const auto b = step_workforce(cfg, st, shock, ws);
    REQUIRE(b.workforce.workers == st.workforce.workers + 10, "hires not applied");
    REQUIRE_NEAR(b.shock_penalty, 14.0, 1e-12, "shock penalty");
    REQUIRE_NEAR(a.workforce.motivation - b.workforce.motivation, 14.0, 1e-9, "motivation gap from shock");
}

void motivation_decays_toward_neutral() {
    const auto cfg = default_config();
    auto st = make_initial_state(cfg);
    st.workforce.motivation = 90.0;
    auto in = default_inputs(cfg);
    in.wage = cfg.workforce.reference_wage;

    Warnings ws;
    const auto out = step_workforce(cfg, st, in, ws);
    REQUIRE_NEAR(out.workforce.motivation, 70.0, 1e-9, "half-way toward neutral 50");
}

void motivation_rises_with_wage_and_profit() {
    const auto cfg = default_config();
    const auto& p = cfg.workforce;
    REQUIRE(motivation_target(p, 1500.0, 0.0, 0.0) > motivation_target(p, 1000.0, 0.0, 0.0), "wage should raise target");
    REQUIRE(motivation_target(p, 1000.0, 100.0, 0.0) > motivation_target(p, 1000.0, 0.0, 0.0), "benefits should raise target");
    REQUIRE(motivation_target(p, 1000.0, 0.0, 5000.0) > motivation_target(p, 1000.0, 0.0, -5000.0), "profit trend should raise target");
    REQUIRE_NEAR(motivation_target(p, 1000.0, 0.0, 1e9), p.neutral_motivation + p.profit_trend_weight, 1e-9, "trend saturates");
}

void steady_profit_is_not_a_trend() {
    const auto cfg = default_config();
    auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.wage = cfg.workforce.reference_wage;
    st.workforce.motivation = cfg.workforce.neutral_motivation;

    // Large but flat profit: no improvement, so motivation stays put.
    st.financial.profit = 40000.0;
    st.financial.previous_profit = 40000.0;
    Warnings ws;
    const auto flat = step_workforce(cfg, st, in, ws);
    REQUIRE_NEAR(flat.workforce.motivation, cfg.workforce.neutral_motivation, 1e-9, "flat profit moved motivation");

    // Smaller profit that is improving lifts motivation.
    st.financial.profit = 5000.0;
    st.financial.previous_profit = 0.0;
    const auto rising = step_workforce(cfg, st, in, ws);
    REQUIRE(rising.workforce.motivation > flat.workforce.motivation, "improving profit should lift motivation");

    // Falling profit, even if still positive, lowers it.
    st.financial.profit = 10000.0;
    st.financial.previous_profit = 30000.0;
    const auto falling = step_workforce(cfg, st, in, ws);
    REQUIRE(falling.workforce.motivation < flat.workforce.motivation, "declining profit should lower motivation");
}

void benefits_lift_motivation_and_cost_per_head() {
    const auto cfg = default_config();
    const auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.worker_benefits = 200.0;

    Warnings ws;
    const auto with = step_workforce(cfg, st, in, ws);
    in.worker_benefits = 0.0;
    const auto without = step_workforce(cfg, st, in, ws);
    REQUIRE_NEAR(with.workforce.motivation - without.workforce.motivation,
                 cfg.workforce.adjust_rate * cfg.workforce.benefits_sensitivity * 200.0, 1e-9, "benefits effect");
    REQUIRE(with.workforce.benefits == 200.0, "benefits recorded");
}

void motivation_stays_bounded() {
    const auto cfg = default_config();
    const auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.wage = 5000.0;

    Warnings ws;
    auto out = step_workforce(cfg, st, in, ws);
    REQUIRE(out.workforce.motivation == INDEX_MAX, "motivation above 100");

    in.wage = 0.0;
    in.hires = -8;
    auto low = st;
    low.workforce.motivation = 2.0;
    out = step_workforce(cfg, low, in, ws);
    REQUIRE(out.workforce.motivation == INDEX_MIN, "motivation below 0");
}

void firing_everyone_warns_when_demand_exists() {
    const auto cfg = default_config();
    const auto st = make_initial_state(cfg);
    REQUIRE(st.commercial.demand > 0.0, "initial demand should be positive");
    auto in = default_inputs(cfg);
    in.hires = -st.workforce.workers;

    Warnings ws;
    const auto out = step_workforce(cfg, st, in, ws);
    REQUIRE(out.workforce.workers == 0, "workforce not emptied");
    REQUIRE(count_kind(ws, WarningKind::WorkforceDepleted) == 1, "missing workforce warning");
}

void maintenance_reduces_wear() {
    const auto cfg = default_config();
    auto st = make_initial_state(cfg);
    st.machines.wear = 50.0;
    st.production.units_produced = 400.0;
    auto in = default_inputs(cfg);

    Warnings ws;
    in.maintenance = 0.0;
    const auto neglected = step_workforce(cfg, st, in, ws);
    in.maintenance = 5000.0;
    const auto serviced = step_workforce(cfg, st, in, ws);

    REQUIRE(serviced.machines.wear < neglected.machines.wear, "maintenance should lower wear");
    REQUIRE(neglected.machines.wear <= INDEX_MAX && serviced.machines.wear >= INDEX_MIN, "wear bounds");
    REQUIRE(neglected.machines.maintenance_backlog == 10 * cfg.machines.maintenance_per_machine, "backlog grows when unserviced");
    REQUIRE(serviced.machines.maintenance_backlog == 0.0, "backlog cleared by maintenance");
}

void machine_count_never_negative() {
    const auto cfg = default_config();
    const auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.machine_delta = -25;

    Warnings ws;
    const auto out = step_workforce(cfg, st, in, ws);
    REQUIRE(out.machines.machines == 0, "machines went negative: " << out.machines.machines);
}

void capacity_is_bottleneck_not_sum() {
    const auto cfg = unit_motivation_config();
    const auto wf = crew(2, 100.0, 10, 0.0);
    const f64 labour = labour_capacity(cfg.production, wf.workforce);
    const f64 machines = machine_capacity(cfg.production, wf.machines);
    REQUIRE_NEAR(labour, 100.0, 1e-9, "labour capacity");
    REQUIRE_NEAR(machines, 500.0, 1e-9, "machine capacity");
    REQUIRE(effective_capacity(cfg.production, wf.workforce, wf.machines) == 100.0, "capacity should be labour-bound");

    const auto worn = crew(20, 100.0, 4, 50.0);
    REQUIRE(effective_capacity(cfg.production, worn.workforce, worn.machines) == 100.0, "capacity should be machine-bound");
}

void material_scarcity_limits_output() {
    const auto cfg = unit_motivation_config();
    const auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.material_purchase = 0.0;

    Warnings ws;
    const auto out = step_production(cfg, st, in, crew(10, 100.0, 10, 0.0), ws);
    REQUIRE(out.report.capacity == 500.0, "capacity");
    REQUIRE(out.report.units_produced == st.inventory.material_stock, "output should equal material on hand");
    REQUIRE(out.material_stock == 0.0, "material not consumed");
    REQUIRE(out.finished_stock == st.inventory.finished_stock + out.report.units_produced, "finished stock");
    REQUIRE_NEAR(out.report.idle_ratio, (500.0 - 16.0) / 500.0, 1e-12, "idle ratio");
    REQUIRE(count_kind(ws, WarningKind::MaterialShortfall) == 1, "missing shortfall warning");
}

void full_material_runs_at_capacity() {
    const auto cfg = unit_motivation_config();
    const auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.material_purchase = 1000.0;

    Warnings ws;
    const auto out = step_production(cfg, st, in, crew(10, 100.0, 10, 0.0), ws);
    REQUIRE(out.report.units_produced == 500.0, "should produce at capacity");
    REQUIRE(out.material_stock == 516.0, "leftover material");
    REQUIRE(ws.empty(), "no warnings expected");
}

void storage_overflow_is_discarded() {
    const auto cfg = unit_motivation_config();
    auto st = make_initial_state(cfg);
    st.inventory.finished_stock = 1990.0;
    auto in = default_inputs(cfg);
    in.material_purchase = 1000.0;

    Warnings ws;
    const auto out = step_production(cfg, st, in, crew(10, 100.0, 10, 0.0), ws);
    REQUIRE(out.finished_stock == st.inventory.storage_capacity, "stock above storage capacity");
    REQUIRE(out.report.overflow_discarded == 490.0, "overflow amount");
    REQUIRE(count_kind(ws, WarningKind::StorageOverflow) == 1, "missing overflow warning");
}

void demand_falls_with_price_and_rises_with_awareness() {
    const auto cfg = default_config();
    const auto& p = cfg.demand;
    REQUIRE(demand_at(p, 0.0, 800.0) == 0.0, "zero price offers nothing");
    REQUIRE(demand_at(p, 30.0, 800.0) > demand_at(p, 60.0, 800.0), "negative elasticity");
    REQUIRE(demand_at(p, 50.0, 1200.0) > demand_at(p, 50.0, 400.0), "awareness raises demand");
    REQUIRE(demand_at(p, 50.0, 800.0) == std::floor(demand_at(p, 50.0, 800.0)), "whole units");
}

void advertising_has_diminishing_returns() {
    const auto cfg = default_config();
    const auto& p = cfg.demand;
    const f64 first = advertising_effect(p, 2000.0) - advertising_effect(p, 0.0);
    const f64 second = advertising_effect(p, 4000.0) - advertising_effect(p, 2000.0);
    REQUIRE(first > second, "second tranche should add less");
    REQUIRE(advertising_effect(p, 1e9) <= p.advertising_effect_max, "effect above ceiling");
    REQUIRE(advertising_effect(p, 0.0) == 0.0, "no spend no effect");
}

void awareness_decays_and_saturates() {
    auto p = default_config().demand;
    REQUIRE(next_awareness(p, 800.0, 0.0, 0, 0) == 400.0, "half-life decay");
    p.awareness_decay = 0.0;
    REQUIRE(next_awareness(p, p.awareness_max, 1e6, 0, 0) == p.awareness_max, "awareness above max");
}

void outlets_and_location_raise_awareness() {
    const auto cfg = default_config();
    const auto& p = cfg.demand;
    const f64 plain = next_awareness(p, 0.0, 2000.0, 0, 0);
    const f64 shops = next_awareness(p, 0.0, 2000.0, 2, 0);
    REQUIRE_NEAR(shops - plain, 2.0 * p.outlet_awareness, 1e-9, "outlet presence");
    const f64 central = next_awareness(p, 0.0, 2000.0, 2, 2);
    REQUIRE_NEAR(central, shops * (1.0 + 2.0 * p.location_awareness), 1e-9, "location amplifies presence");
}

void outlet_trade_depreciates_with_time() {
    const auto cfg = default_config();
    const auto& p = cfg.finance;
    REQUIRE(outlet_trade(p, 2, 5) == 2.0 * p.outlet_price, "outlets bought at list price");
    REQUIRE_NEAR(outlet_trade(p, -1, 10), -(p.outlet_resale_fraction * p.outlet_price - 10.0 * p.outlet_depreciation),
                 1e-9, "resale after depreciation");
    REQUIRE(outlet_trade(p, -2, 1000) == 0.0, "fully depreciated outlets refund nothing");
    REQUIRE(outlet_book_value(p, 1000) == 0.0, "book value floors at zero");
}

void sales_capped_by_stock_and_lost_demand_dropped() {
    const auto cfg = default_config();
    const auto st = make_initial_state(cfg);
    auto in = default_inputs(cfg);
    in.price = 20.0;

    ProductionOutcome prod{};
    prod.finished_stock = 50.0;

    Warnings ws;
    const auto out = step_sales(cfg, st, in, prod, ws);
    REQUIRE(out.demand > 50.0, "demand should exceed stock at a low price");
    REQUIRE(out.units_sold == 50.0, "sales above stock");
    REQUIRE(out.finished_stock == 0.0, "stock not depleted");
    REQUIRE(out.lost_sales == out.demand - 50.0, "lost sales");
    REQUIRE(count_kind(ws, WarningKind::LostSales) == 1, "missing lost sales warning");
}

void machine_trade_buys_at_list_and_sells_at_condition() {
    const auto cfg = default_config();
    const auto& p = cfg.finance;
    REQUIRE(machine_trade(p, 3, 40.0) == 30000.0, "purchase cost");
    REQUIRE_NEAR(machine_trade(p, -2, 50.0), -8000.0, 1e-9, "resale refund");
    REQUIRE(machine_trade(p, 0, 10.0) == 0.0, "no trade");
}

void credit_factor_tracks_deficit() {
    const auto cfg = default_config();
    const auto& p = cfg.finance;
    REQUIRE(credit_factor_for(p, 10.0) == 1.0, "positive cash");
    REQUIRE_NEAR(credit_factor_for(p, -50000.0), 0.5, 1e-12, "half credit");
    REQUIRE(credit_factor_for(p, -1e7) == p.credit_floor, "credit floor");
}

void finance_aggregates_every_flow() {
    auto cfg = default_config();
    cfg.finance.storage_cost_finished = 1.0;
    cfg.finance.storage_cost_material = 0.5;
    cfg.finance.location_rents = {500.0, 1000.0, 2000.0};
    cfg.initial.location = 1;
    cfg.initial.outlets = 1;
    const auto st = make_initial_state(cfg);

    auto in = default_inputs(cfg);
    in.material_purchase = 100.0;
    in.machine_delta = 1;
    in.outlet_delta = 1;
    in.worker_benefits = 20.0;

    WorkforceOutcome wf = crew(9, 60.0, 11, 10.0);
    SalesOutcome sales{};
    sales.units_sold = 200.0;

    Warnings ws;
    const auto out = step_finance(cfg, st, in, wf, sales, ws);
    const auto& c = out.financial.costs;
    REQUIRE(out.financial.revenue == 200.0 * in.price, "revenue");
    REQUIRE(c.material == 100.0 * st.commercial.material_price, "material cost");
    REQUIRE(c.wages == 9 * in.wage, "wages");
    REQUIRE(c.machine_trade == cfg.finance.machine_price, "machine purchase");
    REQUIRE(c.storage == 81.0 + 8.0, "storage cost");
    REQUIRE(c.benefits == 9 * 20.0, "benefits per worker");
    REQUIRE(c.outlet_trade == cfg.finance.outlet_price, "outlet purchase");
    REQUIRE(c.rent == 1000.0 + 2 * cfg.finance.outlet_rent, "location rent plus rent per outlet");
    REQUIRE(c.interest == 0.0, "no interest at a zero rate");
    REQUIRE(out.financial.cost == c.material + c.wages + c.benefits + c.advertising + c.maintenance
                                  + c.machine_trade + c.outlet_trade + c.storage + c.rent + c.interest, "cost total");
    REQUIRE(out.financial.profit == out.financial.revenue - out.financial.cost, "profit");
    REQUIRE(out.financial.cash == st.financial.cash + out.financial.profit, "cash");
    REQUIRE(out.next_material_price == cfg.finance.material_price_schedule[0], "material price schedule");
    REQUIRE(ws.empty(), "no warnings expected");
}

void positive_cash_earns_interest_outside_revenue() {
    auto cfg = default_config();
    cfg.finance.positive_interest = 0.01;
    const auto st = make_initial_state(cfg);
    REQUIRE(st.financial.cash > 0.0, "initial cash should be positive");

    const auto in = default_inputs(cfg);
    SalesOutcome sales{};
    sales.units_sold = 120.0;

    Warnings ws;
    const auto out = step_finance(cfg, st, in, crew(8, 58.0, 10, 6.0), sales, ws);
    REQUIRE(out.financial.revenue == 120.0 * in.price, "revenue is sales only");
    REQUIRE_NEAR(out.financial.costs.interest, -0.01 * st.financial.cash, 1e-9, "interest income nets against cost");
    REQUIRE(out.financial.profit == out.financial.revenue - out.financial.cost, "profit");
}

void negative_cash_raises_low_cash_and_interest() {
    auto cfg = default_config();
    cfg.finance.negative_interest = 0.01;
    auto st = make_initial_state(cfg);
    st.financial.cash = -20000.0;
    st.period = 15;

    const auto in = default_inputs(cfg);
    Warnings ws;
    const auto out = step_finance(cfg, st, in, crew(8, 58.0, 10, 6.0), SalesOutcome{}, ws);
    REQUIRE_NEAR(out.financial.costs.interest, 200.0, 1e-9, "interest on debt");
    REQUIRE(out.financial.cash < st.financial.cash, "cash should fall");
    REQUIRE(out.financial.credit_factor < 1.0, "credit penalty");
    REQUIRE(count_kind(ws, WarningKind::LowCash) == 1, "missing low cash warning");
    REQUIRE(out.next_material_price == cfg.finance.material_price_schedule[1], "schedule wraps around");
}

}

int main() {
    RUN(hiring_shock_costs_motivation);
    RUN(motivation_decays_toward_neutral);
    RUN(motivation_rises_with_wage_and_profit);
    RUN(steady_profit_is_not_a_trend);
    RUN(benefits_lift_motivation_and_cost_per_head);
    RUN(motivation_stays_bounded);
    RUN(firing_everyone_warns_when_demand_exists);
    RUN(maintenance_reduces_wear);
    RUN(machine_count_never_negative);
    RUN(capacity_is_bottleneck_not_sum);
    RUN(material_scarcity_limits_output);
    RUN(full_material_runs_at_capacity);
    RUN(storage_overflow_is_discarded);
    RUN(demand_falls_with_price_and_rises_with_awareness);
    RUN(advertising_has_diminishing_returns);
    RUN(awareness_decays_and_saturates);
    RUN(outlets_and_location_raise_awareness);
    RUN(outlet_trade_depreciates_with_time);
    RUN(sales_capped_by_stock_and_lost_demand_dropped);
    RUN(machine_trade_buys_at_list_and_sells_at_condition);
    RUN(credit_factor_tracks_deficit);
    RUN(finance_aggregates_every_flow);
    RUN(positive_cash_earns_interest_outside_revenue);
    RUN(negative_cash_raises_low_cash_and_interest);
    return 0;
}
