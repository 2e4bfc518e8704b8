// src/sim/sim_app.cpp
#include "sim/sim_app.hpp"
#include "sim/condition_loader.hpp"
#include "sim/simulation_driver.hpp"
#include "sim/synthetic_day.hpp"
#include "sim/timing_controller.hpp"
#include "dispatch/errors.hpp"
#include "engine/decision_engine.hpp"
#include "forecast/lua_forecaster.hpp"
#include "forecast/profile_forecaster.hpp"
#include "plant/battery_model.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"
#include "utils/timestamp.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <utility>

namespace sim {

const char* to_string(RunMode m) {
    switch (m) {
        case RunMode::Backtest: return "backtest";
        case RunMode::Live:     return "live";
        case RunMode::Sweep:    return "sweep";
    }
    return "unknown";
}

SimApp::SimApp(SimAppConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.enable_debug_log_file && !utils::open_log_file(cfg_.debug_log_path)) {
        LOG_WARN("[SimApp] Continuing with stderr logging only");
    }
}

SimApp::~SimApp() {
    utils::close_log_file();
}

forecast::ForecastProviderPtr SimApp::make_provider(const config::ForecastSettings& fs) {
    if (fs.provider == "lua") {
        auto lua = std::make_shared<forecast::LuaForecaster>(fs.lua_script_path, fs.horizon, fs.lookback);
        lua->set_time_budget(fs.predict_timeout_s, fs.retrain_timeout_s);
        if (!lua->init()) {
            throw dispatch::ModelUnavailable("cannot load Lua forecaster: " + fs.lua_script_path);
        }
        return lua;
    }

    if (!fs.profile_dataset_path.empty()) {
        LOG_INFO("[SimApp] Seeding profile forecaster from %s", fs.profile_dataset_path.c_str());
        return forecast::ProfileForecaster::from_dataset(fs.profile_dataset_path, fs.horizon, fs.lookback);
    }
    return std::make_shared<forecast::ProfileForecaster>(fs.horizon, fs.lookback);
}

std::vector<dispatch::Weights> SimApp::weight_grid(size_t points) {
    std::vector<dispatch::Weights> out;
    if (points == 0) return out;
    if (points == 1) {
        out.push_back(dispatch::Weights{0.5, 0.5});
        return out;
    }
    for (size_t i = 0; i < points; ++i) {
        const double cw = static_cast<double>(i) / static_cast<double>(points - 1);
        out.push_back(dispatch::Weights{cw, 1.0 - cw});
    }
    return out;
}

// ============================================================================
// Inputs
// ============================================================================

bool SimApp::load_inputs_() {
    try {
        site_ = config::SiteConfig::load(cfg_.site_config_path);
    } catch (const std::exception& e) {
        LOG_ERROR("[SimApp] %s", e.what());
        return false;
    }

    // Command-line overrides
    if (cfg_.forecast_provider) {
        site_.forecast.provider = *cfg_.forecast_provider;
    }
    if (!cfg_.lua_script_path.empty()) {
        site_.forecast.lua_script_path = cfg_.lua_script_path;
    }
    if (cfg_.charge_from_surplus_solar) {
        site_.optimizer.charge_from_surplus_solar = *cfg_.charge_from_surplus_solar;
    }
    if (cfg_.enable_influx) {
        site_.influx.enabled = true;
    }
    if (site_.influx.token.empty()) {
        site_.influx.token = cfg_.influx_token;
    }
    if (!cfg_.decision_log_path.empty()) {
        site_.decision_log_path = cfg_.decision_log_path;
    }

    try {
        site_.validate();
    } catch (const std::exception& e) {
        LOG_ERROR("[SimApp] Invalid site configuration: %s", e.what());
        return false;
    }
    site_.print_summary();

    if (!cfg_.data_path.empty()) {
        try {
            series_ = load_conditions_csv(cfg_.data_path);
        } catch (const std::exception& e) {
            LOG_ERROR("[SimApp] %s", e.what());
            return false;
        }
    } else {
        SyntheticDayParams sp;
        sp.days = std::max(1, cfg_.synthetic_days);
        sp.seed = cfg_.synthetic_seed;
        series_ = SyntheticDayGenerator(sp).generate();
        LOG_INFO("[SimApp] No dataset given; generated %zu synthetic hours (seed=%llu)",
                 series_.size(), static_cast<unsigned long long>(sp.seed));
    }

    if (series_.empty()) {
        LOG_ERROR("[SimApp] Condition series is empty");
        return false;
    }
    if (!is_time_ordered(series_)) {
        LOG_WARN("[SimApp] Condition series is not in time order");
    }

    if (cfg_.hours > 0 && cfg_.hours < series_.size()) {
        series_.resize(cfg_.hours);
    }

    LOG_INFO("[SimApp] Series: %zu steps, %s .. %s",
             series_.size(),
             utils::format_timestamp(series_.front().timestamp_s).c_str(),
             utils::format_timestamp(series_.back().timestamp_s).c_str());
    return true;
}

// ============================================================================
// Entry
// ============================================================================

int SimApp::run() {
    LOG_INFO("[SimApp] Mode: %s", to_string(cfg_.mode));

    if (!load_inputs_()) {
        return 1;
    }

    switch (cfg_.mode) {
        case RunMode::Backtest: return run_backtest_();
        case RunMode::Live:     return run_live_();
        case RunMode::Sweep:    return run_sweep_();
    }
    return 1;
}

// ============================================================================
// Backtest
// ============================================================================

int SimApp::run_backtest_() {
    engine::DecisionEngine eng;
    try {
        eng.initialize(site_, make_provider(site_.forecast));
    } catch (const std::exception& e) {
        LOG_ERROR("[SimApp] Engine initialization failed: %s", e.what());
        return 1;
    }

    auto report = eng.simulate_realtime(series_, series_.size());
    print_summary(report.simulation);
    LOG_INFO("Forecast (%s): MAE %.3f kW, MAPE %.1f%% over %zu steps",
             eng.provider()->name().c_str(), report.forecast.mae_kw,
             report.forecast.mape_pct, report.forecast.samples);

    if (!cfg_.retrain_dataset_path.empty()) {
        try {
            eng.retrain(cfg_.retrain_dataset_path);
            auto after = eng.simulate_realtime(series_, series_.size());
            LOG_INFO("Forecast after retrain: MAE %.3f kW (was %.3f), MAPE %.1f%% (was %.1f%%)",
                     after.forecast.mae_kw, report.forecast.mae_kw,
                     after.forecast.mape_pct, report.forecast.mape_pct);
        } catch (const dispatch::RetrainFailure& e) {
            LOG_WARN("[SimApp] Retrain failed, previous forecaster kept: %s", e.what());
        }
    }

    if (!cfg_.trace_csv_path.empty() && !write_trace_csv(report.simulation, cfg_.trace_csv_path)) {
        return 1;
    }

    utils::InfluxClient influx(site_.influx);
    if (influx.is_enabled() && !influx.write_simulation_summary(report.simulation, "backtest")) {
        LOG_WARN("[SimApp] Simulation summary not exported to InfluxDB");
    }

    return 0;
}

// ============================================================================
// Live replay
// ============================================================================

int SimApp::run_live_() {
    engine::DecisionEngine eng;
    try {
        eng.initialize(site_, make_provider(site_.forecast));
    } catch (const std::exception& e) {
        LOG_ERROR("[SimApp] Engine initialization failed: %s", e.what());
        return 1;
    }

    utils::InfluxClient influx(site_.influx);
    if (influx.is_enabled()) {
        // false also means rate-limited; send failures are logged by the client
        eng.set_decision_listener([&influx](const engine::DecisionRecord& rec) {
            if (!influx.write_decision(rec)) {
                LOG_DEBUG("[SimApp] Decision at %s not exported",
                          utils::format_timestamp(rec.timestamp_s).c_str());
            }
        });
    }

    TimingController timer(cfg_.step_wall_s);
    const size_t lookback = std::max<size_t>(1, site_.forecast.lookback);
    const size_t retrain_at = cfg_.retrain_dataset_path.empty() ? series_.size() : series_.size() / 2;
    size_t rejected = 0;

    LOG_INFO("[SimApp] Live replay of %zu steps (%s)", series_.size(),
             timer.paced() ? "paced" : "fast-forward");
    timer.reset();

    for (size_t i = 0; i < series_.size(); ++i) {
        timer.mark_step_start();

        if (i == retrain_at) {
            try {
                eng.retrain(cfg_.retrain_dataset_path);
            } catch (const dispatch::RetrainFailure& e) {
                LOG_WARN("[SimApp] Retrain failed, previous forecaster kept: %s", e.what());
            }
        }

        const size_t first = i > lookback ? i - lookback : 0;
        const std::vector<dispatch::ConditionRecord> history(series_.begin() + static_cast<std::ptrdiff_t>(first),
                                                             series_.begin() + static_cast<std::ptrdiff_t>(i));
        try {
            const auto rec = eng.decide(history, series_[i]);
            LOG_INFO("[%s] %.2f kW | battery %.1f%% | %s",
                     utils::format_timestamp(rec.timestamp_s).c_str(), rec.requested_power_kw,
                     eng.battery().soc_pct(), rec.reasoning.c_str());
        } catch (const dispatch::InvalidDemand& e) {
            LOG_ERROR("[SimApp] Step %zu rejected: %s", i, e.what());
            ++rejected;
        }

        if (!timer.wait_for_next_step()) {
            const auto& st = timer.get_stats();
            LOG_WARN("[SimApp] Step %zu overran its slot (%zu misses, max %.1f ms late)",
                     i, st.deadline_misses, st.max_lateness_ms);
        }
    }

    const auto& stats = timer.get_stats();
    LOG_INFO("========================================");
    LOG_INFO("Live Replay Statistics");
    LOG_INFO("========================================");
    LOG_INFO("Decisions logged: %zu (rejected %zu)", eng.decision_log().size(), rejected);
    LOG_INFO("Forecaster: %s (retrains %zu)", eng.provider()->name().c_str(), eng.retrain_count());
    LOG_INFO("Final battery: %.2f kWh (%.1f%%)", eng.battery().charge_kwh(), eng.battery().soc_pct());
    LOG_INFO("Max step time: %.1f ms", stats.max_step_time_ms);
    if (timer.paced()) {
        LOG_INFO("Deadline misses: %zu, final drift %.1f ms",
                 stats.deadline_misses, timer.get_time_drift() * 1000.0);
    }
    LOG_INFO("========================================");

    if (!site_.decision_log_path.empty() && !eng.decision_log().save_csv(site_.decision_log_path)) {
        return 1;
    }
    return 0;
}

// ============================================================================
// Weight sweep
// ============================================================================

int SimApp::run_sweep_() {
    const auto weights = weight_grid(cfg_.sweep_points);
    if (weights.empty()) {
        LOG_ERROR("[SimApp] Sweep needs at least one weight set");
        return 1;
    }

    const dispatch::SourceOptimizer optimizer(site_.optimizer);
    const plant::BatteryModel battery(site_.battery, site_.timestep_hours());

    SimulationDriver driver(false);
    const auto results = driver.run_sweep(series_, battery, optimizer, weights, cfg_.sweep_threads);

    utils::InfluxClient influx(site_.influx);

    std::printf("\n%-8s %-8s %12s %14s %10s %10s %10s %10s\n",
                "cost_w", "carbon_w", "cost", "carbon_kg", "cost_sav%", "co2_sav%", "obj_sav%", "batt_kWh");
    for (const auto& r : results) {
        std::printf("%-8.2f %-8.2f %12.2f %14.2f %10.1f %10.1f %10.1f %10.2f\n",
                    r.weights.cost_weight, r.weights.carbon_weight,
                    r.total_cost, r.total_carbon_g / 1000.0,
                    r.cost_savings_pct, r.carbon_savings_pct, r.objective_savings_pct,
                    r.battery_kwh);

        char run_name[48];
        std::snprintf(run_name, sizeof(run_name), "sweep_cw%.2f", r.weights.cost_weight);
        if (influx.is_enabled() && !influx.write_simulation_summary(r, run_name)) {
            LOG_WARN("[SimApp] Summary for %s not exported to InfluxDB", run_name);
        }
    }
    std::printf("\n");
    return 0;
}

} // namespace sim
