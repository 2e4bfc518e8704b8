// src/sim/sim_app.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/site_config.hpp"
#include "dispatch/dispatch_types.hpp"
#include "forecast/forecast_provider.hpp"

namespace sim {

enum class RunMode {
    Backtest,   // replay through simulate_realtime, report savings and forecast accuracy
    Live,       // decide() step by step against the live battery, optionally paced
    Sweep       // parallel simulations across cost/carbon weight sets
};

const char* to_string(RunMode m);

struct SimAppConfig {
    RunMode mode = RunMode::Backtest;

    // Site
    std::string site_config_path = "config/sites/default.yaml";

    // Input: CSV dataset, or synthetic days when empty
    std::string data_path;
    int synthetic_days = 1;
    uint64_t synthetic_seed = 42;

    // Number of timesteps to replay (0 = whole series)
    size_t hours = 0;

    // Live mode
    double step_wall_s = 0.0;           // wall-clock seconds per timestep, 0 = as fast as possible

    // Sweep mode
    size_t sweep_points = 11;           // cost_weight = 0, 1/(n-1), ..., 1
    unsigned sweep_threads = 0;         // 0 = hardware concurrency

    // Forecaster overrides (empty/unset = from site config)
    std::optional<std::string> forecast_provider;
    std::string lua_script_path;

    // Retrain on this dataset mid-run (live) or between two backtests
    std::string retrain_dataset_path;

    // Optimizer override
    std::optional<bool> charge_from_surplus_solar;

    // Output files (empty = skip)
    std::string decision_log_path;
    std::string trace_csv_path;
    std::string debug_log_path = "vesta_debug.log";
    bool enable_debug_log_file = false;

    // Export decisions/summaries to InfluxDB
    bool enable_influx = false;
    std::string influx_token;           // used when the site config has none
};

/**
 * SimApp - Command-line driver around the decision engine
 *
 * Loads the site, the condition series and the forecaster, then runs one
 * of the RunMode flows. Returns a process exit code.
 */
class SimApp {
public:
    explicit SimApp(SimAppConfig cfg);
    ~SimApp();

    SimApp(const SimApp&) = delete;
    SimApp& operator=(const SimApp&) = delete;

    int run();

    // Site as loaded plus command-line overrides
    const config::SiteConfig& site() const { return site_; }

    /**
     * Build the forecaster named by the site config.
     * @throws dispatch::ModelUnavailable / RetrainFailure if it cannot be loaded
     */
    static forecast::ForecastProviderPtr make_provider(const config::ForecastSettings& fs);

    // cost_weight evenly spaced over [0, 1], carbon_weight = 1 - cost_weight
    static std::vector<dispatch::Weights> weight_grid(size_t points);

private:
    SimAppConfig cfg_;
    config::SiteConfig site_;
    std::vector<dispatch::ConditionRecord> series_;

    bool load_inputs_();

    int run_backtest_();
    int run_live_();
    int run_sweep_();
};

} // namespace sim
