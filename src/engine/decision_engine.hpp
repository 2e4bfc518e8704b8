// src/engine/decision_engine.hpp
#pragma once

#include "config/site_config.hpp"
#include "dispatch/dispatch_types.hpp"
#include "dispatch/source_optimizer.hpp"
#include "engine/decision_log.hpp"
#include "engine/decision_record.hpp"
#include "engine/load_advisor.hpp"
#include "forecast/forecast_provider.hpp"
#include "plant/battery_model.hpp"
#include "sim/simulation_driver.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace engine {

enum class EngineState {
    Uninitialized,   // no optimizer/forecaster wired
    Ready
};

const char* to_string(EngineState s);

struct ForecastAccuracy {
    size_t samples = 0;        // steps with both a forecast and a positive actual
    double mae_kw = 0.0;
    double mape_pct = 0.0;
};

struct BacktestReport {
    sim::SimulationResult simulation;
    ForecastAccuracy forecast;
    std::vector<double> predicted_kw;   // one-step-ahead forecast per replayed step, NaN if none
};

/**
 * DecisionEngine - Orchestrates forecast, optimizer and decision log
 *
 * Lifecycle:
 *   engine.initialize(site, provider);   // Uninitialized -> Ready
 *   auto rec = engine.decide(history, now);
 *   engine.retrain("data/new_week.csv"); // hot-swaps the forecaster
 *
 * decide() is synchronous and single-threaded: it owns the live battery.
 * retrain() may run on another thread; the provider handle is swapped
 * atomically and in-flight predictions keep the old instance alive.
 *
 * At most one forecast worker and one retrain worker exist at a time.
 * While a timed-out worker is still running, further requests of the
 * same kind fail fast instead of starting another thread.
 *
 * The forecast never drives the allocation. It is attached to the record
 * for monitoring and used by simulate_realtime() to score accuracy.
 */
class DecisionEngine {
public:
    DecisionEngine() = default;

    /**
     * Wire the optimizer, battery and forecaster.
     * @throws std::runtime_error (config), dispatch::ModelUnavailable (provider
     *         null or not loaded). The engine stays Uninitialized on failure.
     */
    void initialize(const config::SiteConfig& site, forecast::ForecastProviderPtr provider);

    EngineState state() const { return state_; }
    bool is_ready() const { return state_ == EngineState::Ready; }

    /**
     * Allocate current_conditions.demand_kw against the live battery and log it.
     *
     * @param recent_history Window handed to the forecaster (oldest first)
     * @throws dispatch::EngineNotReady if called before initialize()
     * @throws dispatch::InvalidDemand  negative or NaN demand
     */
    DecisionRecord decide(const std::vector<dispatch::ConditionRecord>& recent_history,
                          const dispatch::ConditionRecord& current_conditions);

    /**
     * Replay the first `hours` timesteps of `sequence` on a copy of the live
     * battery and score the forecaster's one-step-ahead predictions.
     * The live battery and the decision log are untouched.
     *
     * @throws dispatch::EngineNotReady if called before initialize()
     */
    BacktestReport simulate_realtime(const std::vector<dispatch::ConditionRecord>& sequence,
                                     size_t hours);

    /**
     * Retrain the forecaster on a dataset and swap it in.
     * @throws dispatch::RetrainFailure on failure or timeout; the previous
     *         forecaster stays in service
     * @throws dispatch::EngineNotReady if called before initialize()
     */
    void retrain(const std::string& dataset_path);

    // Current forecaster (atomic snapshot)
    forecast::ForecastProviderPtr provider() const;

    /**
     * Forecast for the window under the configured timeout.
     * @return empty on timeout, model failure, or while an earlier timed-out
     *         forecast is still running (logged as a warning)
     */
    std::vector<double> request_forecast(const std::vector<dispatch::ConditionRecord>& window) const;

    const plant::BatteryModel& battery() const { return battery_; }
    const dispatch::SourceOptimizer& optimizer() const { return optimizer_; }
    const config::SiteConfig& site() const { return site_; }
    const DecisionLog& decision_log() const { return log_; }
    const LoadAdvisor& load_advisor() const { return advisor_; }

    size_t retrain_count() const { return retrain_count_.load(); }

    // Called after every appended decision (e.g. telemetry export)
    void set_decision_listener(std::function<void(const DecisionRecord&)> listener) {
        listener_ = std::move(listener);
    }

private:
    EngineState state_ = EngineState::Uninitialized;

    config::SiteConfig site_;
    dispatch::SourceOptimizer optimizer_;
    plant::BatteryModel battery_;
    LoadAdvisor advisor_;
    DecisionLog log_;

    // Read with std::atomic_load, replaced with std::atomic_store under retrain_mtx_
    forecast::ForecastProviderPtr provider_;
    std::mutex retrain_mtx_;
    std::atomic<size_t> retrain_count_{0};

    // Set while a worker runs; shared with the worker so it can outlive the engine
    std::shared_ptr<std::atomic<bool>> forecast_busy_ = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> retrain_busy_ = std::make_shared<std::atomic<bool>>(false);

    std::function<void(const DecisionRecord&)> listener_;

    void require_ready_(const char* op) const;

    std::string build_reasoning_(const DecisionRecord& rec) const;
};

} // namespace engine
