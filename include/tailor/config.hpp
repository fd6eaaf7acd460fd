#pragma once
#include <string>
#include "tailor/types.hpp"

namespace tailor {

    // Documented period-0 values.
    struct InitialValues {
        f64 cash;
        f64 material_stock;
        f64 finished_stock;
        f64 storage_capacity;
        i32 workers;
        f64 motivation;
        f64 wage;
        f64 worker_benefits;
        i32 machines;
        f64 wear;
        f64 maintenance_backlog;
        f64 price;
        f64 advertising;
        f64 maintenance;
        f64 awareness;
        f64 material_price;
        i32 outlets;
        i32 location;
    };

    struct InputLimits {
        f64 price_max;
        f64 material_purchase_max;
        f64 advertising_max;
        f64 wage_max;
        f64 benefits_max;
        i32 hire_max;
        i32 workers_max;
        i32 machine_purchase_max;
        i32 machines_max;
        f64 maintenance_max;
        i32 outlets_max;

        bool use_steps;
        f64 price_step;
        f64 material_purchase_step;
        f64 advertising_step;
        f64 wage_step;
        f64 benefits_step;
        f64 maintenance_step;
    };

    struct WorkforceParams {
        f64 neutral_motivation;
        f64 reference_wage;
        f64 wage_sensitivity;
        f64 benefits_sensitivity;
        f64 profit_trend_weight;
        f64 profit_trend_scale;
        f64 adjust_rate;
        i32 shock_threshold;
        f64 shock_penalty;
    };

    struct MachineParams {
        f64 base_wear;
        f64 wear_retention;
        f64 usage_wear;
        f64 backlog_wear;
        f64 maintenance_efficiency;
        f64 maintenance_per_machine;
    };

    struct ProductionParams {
        f64 output_per_worker;
        f64 output_per_machine;
        f64 motivation_scale;
        f64 wear_penalty;
        f64 material_per_unit;
    };

    struct DemandParams {
        f64 base_demand;
        f64 awareness_weight;
        f64 awareness_max;
        f64 awareness_decay;
        f64 advertising_effect_max;
        f64 advertising_saturation;
        f64 outlet_awareness;
        f64 location_awareness;
        f64 elasticity_scale;
        f64 elasticity_width;
    };

    struct FinanceParams {
        f64 machine_price;
        f64 resale_fraction;
        f64 storage_cost_finished;
        f64 storage_cost_material;
        f64 outlet_price;
        f64 outlet_resale_fraction;
        f64 outlet_depreciation;
        f64 outlet_rent;
        Vec location_rents;
        f64 positive_interest;
        f64 negative_interest;
        f64 credit_scale;
        f64 credit_floor;
        f64 material_value;
        f64 finished_value;
        Vec material_price_schedule;
    };

    // horizon 0 runs until close(); otherwise the run closes itself after that period.
    struct RunParams {
        i32 horizon;
    };

    struct ShopConfig {
        RunParams run;
        InitialValues initial;
        InputLimits limits;
        WorkforceParams workforce;
        MachineParams machines;
        ProductionParams production;
        DemandParams demand;
        FinanceParams finance;
    };

    ShopConfig default_config();
    ShopConfig load_config(const std::string& path);
    void validate_config(const ShopConfig& cfg);
}
