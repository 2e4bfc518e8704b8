// src/dispatch/source_optimizer.hpp
#pragma once

#include "dispatch/dispatch_types.hpp"
#include "plant/battery_model.hpp"

namespace dispatch {

struct OptimizerParams {
    // Solar array
    double solar_capacity_kw = 3.0;
    double cloud_derate = 0.1;           // fraction of output lost at 100% cloud
    int daylight_start_hour = 6;         // inclusive
    int daylight_end_hour = 18;          // exclusive

    // Scoring
    double carbon_cost_per_kg = 10.0;                 // currency per kg CO2
    double battery_degradation_cost_per_kwh = 0.10;
    double battery_lifecycle_carbon_g_per_kwh = 100.0;
    // Solar output is free at the point of use unless configured
    // (amortized figures such as 0.05/kWh and 50 g/kWh are opt-in)
    double solar_maintenance_cost_per_kwh = 0.0;
    double solar_lifecycle_carbon_g_per_kwh = 0.0;

    double timestep_hours = 1.0;

    // Route solar beyond demand into the battery. Off unless configured.
    bool charge_from_surplus_solar = false;
};

/**
 * SourceOptimizer - Greedy single-timestep source allocation
 *
 * Stages, evaluated in order with no backtracking:
 *   1. Solar      - supplies min(demand, available solar)
 *   2. Battery vs Grid - lower per-kWh weighted score supplies the remainder
 *                  up to its headroom (ties go to the battery); the grid
 *                  absorbs whatever is left unconditionally
 *   3. Apply      - discharge (and optional surplus charge) hit the battery
 *
 * The optimizer is stateless; all mutable state lives in the BatteryModel
 * passed in. One battery must not be optimized from two threads at once.
 *
 * Usage:
 *   dispatch::SourceOptimizer opt(params);
 *   plant::BatteryModel battery(bp, params.timestep_hours);
 *   auto d = opt.optimize(1.4, conditions, battery, {0.5, 0.5});
 */
class SourceOptimizer {
public:
    explicit SourceOptimizer(const OptimizerParams& params = {});

    /**
     * @throws InvalidDemand     power_needed_kw negative or NaN
     * @throws ModelUnavailable  conditions carry non-finite solar or market inputs
     */
    Decision optimize(double power_needed_kw,
                      const ConditionRecord& conditions,
                      plant::BatteryModel& battery,
                      const Weights& weights) const;

    /**
     * Everything from the grid; battery untouched. Used as the degraded
     * path when conditions cannot be scored. Missing market inputs count as 0.
     */
    Decision grid_only(double power_needed_kw,
                       const ConditionRecord& conditions,
                       const plant::BatteryModel& battery) const;

    // Monotonic in irradiance, decreasing in cloud cover, bounded to [0, 1].
    double solar_output_factor(const ConditionRecord& c) const;
    double solar_available_kw(const ConditionRecord& c) const;

    double grid_score(const ConditionRecord& c, const Weights& w) const;
    double battery_score(const Weights& w) const;

    // Monetary equivalent of a carbon quantity
    double carbon_cost_equivalent(double carbon_g) const;

    const OptimizerParams& params() const { return params_; }

private:
    OptimizerParams params_;

    void fill_metrics_(const Allocation& alloc,
                       const ConditionRecord& c,
                       DecisionMetrics& m) const;
};

} // namespace dispatch
