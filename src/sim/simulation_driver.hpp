// src/sim/simulation_driver.hpp
#pragma once

#include "dispatch/dispatch_types.hpp"
#include "dispatch/source_optimizer.hpp"
#include "plant/battery_model.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace sim {

// One replayed timestep, kept for trace export
struct StepResult {
    size_t index = 0;
    dispatch::ConditionRecord conditions;
    dispatch::Allocation allocation;
    dispatch::DecisionMetrics metrics;
    double baseline_cost = 0.0;
    double baseline_carbon_g = 0.0;
};

// A timestep the optimizer rejected; contributes nothing to the totals
struct SimulationGap {
    size_t index = 0;
    int64_t timestamp_s = 0;
    std::string reason;
};

struct SimulationResult {
    dispatch::Weights weights;

    double total_cost = 0.0;
    double total_carbon_g = 0.0;
    double total_demand_kwh = 0.0;

    // Energy delivered per source (kWh)
    double solar_kwh = 0.0;
    double battery_kwh = 0.0;
    double grid_kwh = 0.0;
    double battery_charged_kwh = 0.0;

    double baseline_grid_only_cost = 0.0;
    double baseline_grid_only_carbon_g = 0.0;

    // (baseline - actual) / baseline * 100; 0 when the baseline is 0
    double cost_savings_pct = 0.0;
    double carbon_savings_pct = 0.0;
    // Same ratio on cost_weight*cost + carbon_weight*carbon cost equivalent
    double objective_savings_pct = 0.0;

    double initial_battery_kwh = 0.0;
    double final_battery_kwh = 0.0;

    size_t steps_total = 0;
    size_t steps_ok = 0;
    std::vector<SimulationGap> gaps;
    std::vector<StepResult> steps;

    double source_kwh(dispatch::Source s) const;
};

/**
 * SimulationDriver - Replays a condition sequence through the optimizer
 *
 * The sequence must be in non-decreasing timestamp order; out-of-order
 * records are replayed anyway with a warning.
 *
 * Each run owns its own copy of the battery, so independent runs may
 * execute concurrently (see run_sweep). Within a run, steps are strictly
 * sequential.
 */
class SimulationDriver {
public:
    explicit SimulationDriver(bool keep_steps = true) : keep_steps_(keep_steps) {}

    SimulationResult simulate(const std::vector<dispatch::ConditionRecord>& sequence,
                              const plant::BatteryModel& initial_battery,
                              const dispatch::SourceOptimizer& optimizer,
                              const dispatch::Weights& weights) const;

    /**
     * simulate() variant that leaves the final battery state in `battery`.
     * Used when the caller owns the battery across runs.
     */
    SimulationResult simulate_in_place(const std::vector<dispatch::ConditionRecord>& sequence,
                                       plant::BatteryModel& battery,
                                       const dispatch::SourceOptimizer& optimizer,
                                       const dispatch::Weights& weights) const;

    /**
     * Run one simulation per weight set in parallel, each against its own
     * copy of `initial_battery`. Results come back in weight-set order.
     *
     * @param max_threads 0 = hardware concurrency
     */
    std::vector<SimulationResult> run_sweep(const std::vector<dispatch::ConditionRecord>& sequence,
                                            const plant::BatteryModel& initial_battery,
                                            const dispatch::SourceOptimizer& optimizer,
                                            const std::vector<dispatch::Weights>& weight_sets,
                                            unsigned max_threads = 0) const;

private:
    bool keep_steps_;
};

double savings_pct(double baseline, double actual);

void print_summary(const SimulationResult& r);

/**
 * Write the per-step trace as CSV.
 * @return false if the file cannot be opened
 */
bool write_trace_csv(const SimulationResult& r, const std::string& path);

} // namespace sim
