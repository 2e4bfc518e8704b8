// src/sim/simulation_driver.cpp
#include "sim/simulation_driver.hpp"
#include "dispatch/errors.hpp"
#include "utils/logging.hpp"
#include "utils/timestamp.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <thread>

namespace sim {

double SimulationResult::source_kwh(dispatch::Source s) const {
    switch (s) {
        case dispatch::Source::Solar:   return solar_kwh;
        case dispatch::Source::Battery: return battery_kwh;
        case dispatch::Source::Grid:    return grid_kwh;
    }
    return 0.0;
}

double savings_pct(double baseline, double actual) {
    if (!(std::abs(baseline) > 1e-12) || !std::isfinite(baseline) || !std::isfinite(actual)) {
        return 0.0;
    }
    return (baseline - actual) / baseline * 100.0;
}

SimulationResult SimulationDriver::simulate(const std::vector<dispatch::ConditionRecord>& sequence,
                                            const plant::BatteryModel& initial_battery,
                                            const dispatch::SourceOptimizer& optimizer,
                                            const dispatch::Weights& weights) const {
    plant::BatteryModel battery = initial_battery;
    return simulate_in_place(sequence, battery, optimizer, weights);
}

SimulationResult SimulationDriver::simulate_in_place(const std::vector<dispatch::ConditionRecord>& sequence,
                                                     plant::BatteryModel& battery,
                                                     const dispatch::SourceOptimizer& optimizer,
                                                     const dispatch::Weights& weights) const {
    const double dt = optimizer.params().timestep_hours;

    SimulationResult r;
    r.weights = weights;
    r.initial_battery_kwh = battery.charge_kwh();
    r.steps_total = sequence.size();
    if (keep_steps_) r.steps.reserve(sequence.size());

    double objective_actual = 0.0;
    double objective_baseline = 0.0;
    bool warned_order = false;

    for (size_t i = 0; i < sequence.size(); ++i) {
        const auto& c = sequence[i];

        if (!warned_order && i > 0 && c.timestamp_s < sequence[i - 1].timestamp_s) {
            LOG_WARN("[Simulation] Record %zu is out of time order (%s after %s); results are not meaningful",
                     i, utils::format_timestamp(c.timestamp_s).c_str(),
                     utils::format_timestamp(sequence[i - 1].timestamp_s).c_str());
            warned_order = true;
        }

        dispatch::Decision d;
        try {
            d = optimizer.optimize(c.demand_kw, c, battery, weights);
        } catch (const std::runtime_error& e) {
            // Only this timestep is lost
            LOG_WARN("[Simulation] Step %zu skipped: %s", i, e.what());
            r.gaps.push_back(SimulationGap{i, c.timestamp_s, e.what()});
            continue;
        }

        // Grid-only baseline for the same demand and conditions, battery untouched
        const double demand_kwh = c.demand_kw * dt;
        const double base_cost = demand_kwh * c.grid_price_per_kwh;
        const double base_carbon = demand_kwh * c.carbon_intensity_g_per_kwh;

        r.total_cost += d.metrics.estimated_cost;
        r.total_carbon_g += d.metrics.estimated_carbon_g;
        r.total_demand_kwh += demand_kwh;
        r.solar_kwh += dispatch::allocated_kw(d.allocation, dispatch::Source::Solar) * dt;
        r.battery_kwh += dispatch::allocated_kw(d.allocation, dispatch::Source::Battery) * dt;
        r.grid_kwh += dispatch::allocated_kw(d.allocation, dispatch::Source::Grid) * dt;
        r.battery_charged_kwh += d.metrics.battery_charged_kw * dt;
        r.baseline_grid_only_cost += base_cost;
        r.baseline_grid_only_carbon_g += base_carbon;

        objective_actual += weights.cost_weight * d.metrics.estimated_cost +
                            weights.carbon_weight * optimizer.carbon_cost_equivalent(d.metrics.estimated_carbon_g);
        objective_baseline += weights.cost_weight * base_cost +
                              weights.carbon_weight * optimizer.carbon_cost_equivalent(base_carbon);

        ++r.steps_ok;

        if (keep_steps_) {
            StepResult s;
            s.index = i;
            s.conditions = c;
            s.allocation = std::move(d.allocation);
            s.metrics = d.metrics;
            s.baseline_cost = base_cost;
            s.baseline_carbon_g = base_carbon;
            r.steps.push_back(std::move(s));
        }
    }

    r.cost_savings_pct = savings_pct(r.baseline_grid_only_cost, r.total_cost);
    r.carbon_savings_pct = savings_pct(r.baseline_grid_only_carbon_g, r.total_carbon_g);
    r.objective_savings_pct = savings_pct(objective_baseline, objective_actual);
    r.final_battery_kwh = battery.charge_kwh();

    LOG_INFO("[Simulation] %zu/%zu steps (%zu gaps), cost=%.2f vs %.2f grid-only, carbon=%.2f kg vs %.2f kg",
             r.steps_ok, r.steps_total, r.gaps.size(),
             r.total_cost, r.baseline_grid_only_cost,
             r.total_carbon_g / 1000.0, r.baseline_grid_only_carbon_g / 1000.0);

    return r;
}

std::vector<SimulationResult> SimulationDriver::run_sweep(const std::vector<dispatch::ConditionRecord>& sequence,
                                                          const plant::BatteryModel& initial_battery,
                                                          const dispatch::SourceOptimizer& optimizer,
                                                          const std::vector<dispatch::Weights>& weight_sets,
                                                          unsigned max_threads) const {
    std::vector<SimulationResult> results(weight_sets.size());
    if (weight_sets.empty()) return results;

    unsigned n_threads = max_threads;
    if (n_threads == 0) n_threads = std::max(1u, std::thread::hardware_concurrency());
    n_threads = std::min<unsigned>(n_threads, static_cast<unsigned>(weight_sets.size()));

    LOG_INFO("[Simulation] Sweep: %zu weight sets on %u threads", weight_sets.size(), n_threads);

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < weight_sets.size(); i = next++) {
            // Own battery copy per run; slots in `results` are disjoint
            results[i] = simulate(sequence, initial_battery, optimizer, weight_sets[i]);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(n_threads);
    for (unsigned t = 0; t < n_threads; ++t) pool.emplace_back(worker);
    for (auto& th : pool) th.join();

    return results;
}

void print_summary(const SimulationResult& r) {
    LOG_INFO("========================================");
    LOG_INFO("Simulation Summary (cost_weight=%.2f carbon_weight=%.2f)",
             r.weights.cost_weight, r.weights.carbon_weight);
    LOG_INFO("========================================");
    LOG_INFO("Steps: %zu ok / %zu total (%zu gaps)", r.steps_ok, r.steps_total, r.gaps.size());
    LOG_INFO("Demand: %.2f kWh", r.total_demand_kwh);
    for (auto src : {dispatch::Source::Solar, dispatch::Source::Battery, dispatch::Source::Grid}) {
        const double kwh = r.source_kwh(src);
        LOG_INFO("  %-8s %8.2f kWh (%5.1f%% of demand)", dispatch::to_string(src), kwh,
                 r.total_demand_kwh > 0.0 ? 100.0 * kwh / r.total_demand_kwh : 0.0);
    }
    if (r.battery_charged_kwh > 0.0) {
        LOG_INFO("Battery charged from surplus solar: %.2f kWh", r.battery_charged_kwh);
    }
    LOG_INFO("Battery: %.2f kWh -> %.2f kWh", r.initial_battery_kwh, r.final_battery_kwh);
    LOG_INFO("----------------------------------------");
    LOG_INFO("With optimization: cost %.2f, carbon %.2f kg", r.total_cost, r.total_carbon_g / 1000.0);
    LOG_INFO("Grid only:         cost %.2f, carbon %.2f kg",
             r.baseline_grid_only_cost, r.baseline_grid_only_carbon_g / 1000.0);
    LOG_INFO("Savings: cost %.1f%%, carbon %.1f%%, weighted objective %.1f%%",
             r.cost_savings_pct, r.carbon_savings_pct, r.objective_savings_pct);
    LOG_INFO("========================================");
}

bool write_trace_csv(const SimulationResult& r, const std::string& path) {
    std::ofstream csv(path);
    if (!csv) {
        LOG_ERROR("[Simulation] Failed to open trace CSV: %s", path.c_str());
        return false;
    }

    csv << "index,timestamp,hour,demand_kw,solar_kw,battery_kw,grid_kw,"
        << "battery_charged_kw,battery_charge_kwh,cost,carbon_g,"
        << "baseline_cost,baseline_carbon_g,grid_price_per_kwh,carbon_intensity_g_per_kwh\n";
    csv << std::fixed << std::setprecision(6);

    for (const auto& s : r.steps) {
        csv << s.index << ","
            << utils::format_timestamp(s.conditions.timestamp_s) << ","
            << s.conditions.hour_of_day << ","
            << s.conditions.demand_kw << ","
            << dispatch::allocated_kw(s.allocation, dispatch::Source::Solar) << ","
            << dispatch::allocated_kw(s.allocation, dispatch::Source::Battery) << ","
            << dispatch::allocated_kw(s.allocation, dispatch::Source::Grid) << ","
            << s.metrics.battery_charged_kw << ","
            << s.metrics.battery_charge_after_kwh << ","
            << s.metrics.estimated_cost << ","
            << s.metrics.estimated_carbon_g << ","
            << s.baseline_cost << ","
            << s.baseline_carbon_g << ","
            << s.conditions.grid_price_per_kwh << ","
            << s.conditions.carbon_intensity_g_per_kwh << "\n";
    }

    LOG_INFO("[Simulation] Trace written to: %s (%zu rows)", path.c_str(), r.steps.size());
    return true;
}

} // namespace sim
