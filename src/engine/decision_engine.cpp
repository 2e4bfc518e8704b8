// src/engine/decision_engine.cpp
#include "engine/decision_engine.hpp"
#include "dispatch/errors.hpp"
#include "utils/logging.hpp"
#include "utils/timestamp.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <future>
#include <limits>
#include <memory>
#include <thread>
#include <utility>

namespace engine {

namespace {

// Run fn on a detached worker and wait at most timeout_s for it. The
// worker keeps running past the deadline; whatever it produces then is
// dropped with the promise. `busy` must already be set by the caller and
// is cleared by the worker once fn returns, before the result is published.
template <typename T, typename Fn>
std::future_status run_with_timeout(Fn fn, double timeout_s, std::future<T>& result,
                                    std::shared_ptr<std::atomic<bool>> busy) {
    auto promise = std::make_shared<std::promise<T>>();
    result = promise->get_future();

    std::thread([promise, fn, busy]() {
        try {
            T value = fn();
            busy->store(false);
            promise->set_value(std::move(value));
        } catch (...) {
            busy->store(false);
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return result.wait_for(std::chrono::duration<double>(timeout_s));
}

void append_part(std::string& out, const std::string& part) {
    if (part.empty()) return;
    if (!out.empty()) out += " | ";
    out += part;
}

} // namespace

const char* to_string(EngineState s) {
    return s == EngineState::Ready ? "READY" : "UNINITIALIZED";
}

// ============================================================================
// Lifecycle
// ============================================================================

void DecisionEngine::initialize(const config::SiteConfig& site, forecast::ForecastProviderPtr provider) {
    state_ = EngineState::Uninitialized;

    try {
        site.validate();
    } catch (const std::exception& e) {
        LOG_ERROR("[Engine] Initialization failed: %s", e.what());
        throw;
    }
    for (const auto& w : site.warnings()) {
        LOG_WARN("[Engine] %s", w.c_str());
    }

    if (!provider) {
        LOG_ERROR("[Engine] Initialization failed: no forecast provider");
        throw dispatch::ModelUnavailable("no forecast provider supplied");
    }
    if (!provider->is_loaded()) {
        LOG_ERROR("[Engine] Initialization failed: forecaster %s is not loaded", provider->name().c_str());
        throw dispatch::ModelUnavailable("forecast provider '" + provider->name() + "' is not loaded");
    }

    site_ = site;
    optimizer_ = dispatch::SourceOptimizer(site.optimizer);
    battery_ = plant::BatteryModel(site.battery, site.optimizer.timestep_hours);
    advisor_ = LoadAdvisor(site.loads);
    std::atomic_store(&provider_, provider);
    retrain_count_.store(0);

    state_ = EngineState::Ready;
    LOG_INFO("[Engine] Ready: site=%s forecaster=%s battery=%.2f/%.2f kWh",
             site_.name.c_str(), provider->name().c_str(),
             battery_.charge_kwh(), battery_.capacity_kwh());
}

void DecisionEngine::require_ready_(const char* op) const {
    if (state_ != EngineState::Ready) {
        throw dispatch::EngineNotReady(std::string(op) + "() called while engine is " + to_string(state_));
    }
}

forecast::ForecastProviderPtr DecisionEngine::provider() const {
    return std::atomic_load(&provider_);
}

// ============================================================================
// Forecast
// ============================================================================

std::vector<double> DecisionEngine::request_forecast(
    const std::vector<dispatch::ConditionRecord>& window) const {
    auto p = provider();
    if (!p) {
        LOG_WARN("[Engine] No forecaster wired; continuing without forecast");
        return {};
    }

    if (forecast_busy_->exchange(true)) {
        LOG_WARN("[Engine] Previous forecast from %s still running; continuing without forecast",
                 p->name().c_str());
        return {};
    }

    std::future<std::vector<double>> fut;
    const auto status = run_with_timeout<std::vector<double>>(
        [p, window]() { return p->predict(window); },
        site_.forecast.predict_timeout_s, fut, forecast_busy_);

    if (status != std::future_status::ready) {
        LOG_WARN("[Engine] Forecast from %s timed out after %.2f s; continuing without forecast",
                 p->name().c_str(), site_.forecast.predict_timeout_s);
        return {};
    }

    try {
        return fut.get();
    } catch (const dispatch::ModelUnavailable& e) {
        LOG_WARN("[Engine] Forecast unavailable: %s", e.what());
    } catch (const std::exception& e) {
        LOG_WARN("[Engine] Forecaster %s failed: %s", p->name().c_str(), e.what());
    }
    return {};
}

// ============================================================================
// Decide
// ============================================================================

DecisionRecord DecisionEngine::decide(const std::vector<dispatch::ConditionRecord>& recent_history,
                                      const dispatch::ConditionRecord& current_conditions) {
    require_ready_("decide");

    const double demand_kw = current_conditions.demand_kw;

    DecisionRecord rec;
    rec.timestamp_s = current_conditions.timestamp_s;
    rec.requested_power_kw = demand_kw;
    rec.weights = site_.weights;

    dispatch::Decision d;
    try {
        d = optimizer_.optimize(demand_kw, current_conditions, battery_, site_.weights);
    } catch (const dispatch::ModelUnavailable& e) {
        LOG_WARN("[Engine] Falling back to grid-only at %s: %s",
                 utils::format_timestamp(current_conditions.timestamp_s).c_str(), e.what());
        d = optimizer_.grid_only(demand_kw, current_conditions, battery_);
        rec.fallback = true;
        rec.fallback_reason = e.what();
    }
    rec.allocation = std::move(d.allocation);
    rec.metrics = d.metrics;

    auto p = provider();
    rec.forecast_provider = p ? p->name() : "";
    rec.forecast_kw = request_forecast(recent_history);

    rec.load_shedding = advisor_.recommend(current_conditions.carbon_intensity_g_per_kwh,
                                           current_conditions.grid_price_per_kwh);
    rec.reasoning = build_reasoning_(rec);

    LOG_DEBUG("[Engine] %s demand=%.3f kW -> %s",
              utils::format_timestamp(rec.timestamp_s).c_str(), demand_kw, rec.reasoning.c_str());

    log_.append(rec);
    if (listener_) {
        listener_(rec);
    }
    return rec;
}

std::string DecisionEngine::build_reasoning_(const DecisionRecord& rec) const {
    using dispatch::Source;

    const auto& m = rec.metrics;
    const double solar_kw = dispatch::allocated_kw(rec.allocation, Source::Solar);
    const double battery_kw = dispatch::allocated_kw(rec.allocation, Source::Battery);
    const double grid_kw = dispatch::allocated_kw(rec.allocation, Source::Grid);

    std::string out;
    char buf[200];

    if (rec.fallback) {
        append_part(out, "Grid-only fallback: " + rec.fallback_reason);
    }

    if (rec.allocation.empty()) {
        append_part(out, "No demand this step");
    }

    if (solar_kw > 0.0) {
        std::snprintf(buf, sizeof(buf), "Solar %.2f kW of %.2f kW available (used first)",
                      solar_kw, m.solar_available_kw);
        append_part(out, buf);
    }

    if (battery_kw > 0.0) {
        std::snprintf(buf, sizeof(buf), "Battery %.2f kW (score %.3f <= grid %.3f)",
                      battery_kw, m.battery_score, m.grid_score);
        append_part(out, buf);
    }

    if (grid_kw > 0.0 && !rec.fallback) {
        if (m.battery_score <= m.grid_score) {
            std::snprintf(buf, sizeof(buf),
                          "Grid %.2f kW (battery scored lower, %.3f <= grid %.3f, but headroom %.2f kW exhausted)",
                          grid_kw, m.battery_score, m.grid_score, m.battery_headroom_kw);
        } else {
            std::snprintf(buf, sizeof(buf), "Grid %.2f kW (score %.3f < battery %.3f)",
                          grid_kw, m.grid_score, m.battery_score);
        }
        append_part(out, buf);
    }

    if (m.battery_charged_kw > 0.0) {
        std::snprintf(buf, sizeof(buf), "Stored %.2f kW of surplus solar", m.battery_charged_kw);
        append_part(out, buf);
    }

    if (rec.load_shedding.any_deferred()) {
        append_part(out, "Load shedding: " + rec.load_shedding.summary());
    }

    if (rec.has_forecast() && rec.requested_power_kw > 0.0 &&
        rec.forecast_kw.front() > rec.requested_power_kw * 1.2) {
        std::snprintf(buf, sizeof(buf), "Demand expected to rise to %.2f kW next step",
                      rec.forecast_kw.front());
        append_part(out, buf);
    }

    const double cap = battery_.capacity_kwh();
    const double pct = cap > 0.0 ? m.battery_charge_after_kwh / cap * 100.0 : 0.0;
    if (pct < 20.0) {
        append_part(out, "Battery low - consider charging during low-cost hours");
    } else if (pct > 80.0) {
        append_part(out, "Battery well charged");
    }

    return out;
}

// ============================================================================
// Backtest
// ============================================================================

BacktestReport DecisionEngine::simulate_realtime(const std::vector<dispatch::ConditionRecord>& sequence,
                                                 size_t hours) {
    require_ready_("simulate_realtime");

    const size_t n = std::min(hours, sequence.size());
    const std::vector<dispatch::ConditionRecord> replay(sequence.begin(),
                                                        sequence.begin() + static_cast<std::ptrdiff_t>(n));

    LOG_INFO("[Engine] Simulating %zu of %zu timesteps on a copy of the live battery (%.2f kWh)",
             n, sequence.size(), battery_.charge_kwh());

    BacktestReport report;
    sim::SimulationDriver driver;
    report.simulation = driver.simulate(replay, battery_, optimizer_, site_.weights);

    // One-step-ahead forecast for each replayed step from the records before it
    const size_t lookback = std::max<size_t>(1, site_.forecast.lookback);
    report.predicted_kw.assign(n, std::numeric_limits<double>::quiet_NaN());

    double abs_err_sum = 0.0;
    double pct_err_sum = 0.0;
    size_t pct_samples = 0;

    for (size_t i = 1; i < n; ++i) {
        const size_t first = i > lookback ? i - lookback : 0;
        const std::vector<dispatch::ConditionRecord> window(
            replay.begin() + static_cast<std::ptrdiff_t>(first),
            replay.begin() + static_cast<std::ptrdiff_t>(i));

        const auto fc = request_forecast(window);
        if (fc.empty() || !std::isfinite(fc.front())) continue;

        report.predicted_kw[i] = fc.front();

        const double actual = replay[i].demand_kw;
        if (!std::isfinite(actual)) continue;

        abs_err_sum += std::fabs(fc.front() - actual);
        report.forecast.samples++;
        if (actual > 1e-9) {
            pct_err_sum += std::fabs(fc.front() - actual) / actual * 100.0;
            pct_samples++;
        }
    }

    if (report.forecast.samples > 0) {
        report.forecast.mae_kw = abs_err_sum / static_cast<double>(report.forecast.samples);
    }
    if (pct_samples > 0) {
        report.forecast.mape_pct = pct_err_sum / static_cast<double>(pct_samples);
    }

    LOG_INFO("[Engine] Forecast accuracy over %zu steps: MAE=%.3f kW MAPE=%.1f%%",
             report.forecast.samples, report.forecast.mae_kw, report.forecast.mape_pct);
    return report;
}

// ============================================================================
// Retrain
// ============================================================================

void DecisionEngine::retrain(const std::string& dataset_path) {
    require_ready_("retrain");

    std::lock_guard<std::mutex> lock(retrain_mtx_);
    auto current = provider();
    const double timeout_s = site_.forecast.retrain_timeout_s;

    LOG_INFO("[Engine] Retraining %s on %s (timeout %.0f s)",
             current->name().c_str(), dataset_path.c_str(), timeout_s);

    if (retrain_busy_->exchange(true)) {
        LOG_ERROR("[Engine] Previous retrain still running; keeping %s", current->name().c_str());
        throw dispatch::RetrainFailure("a previous retrain is still running");
    }

    std::future<forecast::ForecastProviderPtr> fut;
    const auto status = run_with_timeout<forecast::ForecastProviderPtr>(
        [current, dataset_path]() { return current->retrain(dataset_path); },
        timeout_s, fut, retrain_busy_);

    if (status != std::future_status::ready) {
        LOG_ERROR("[Engine] Retrain timed out after %.1f s; keeping %s", timeout_s, current->name().c_str());
        throw dispatch::RetrainFailure("retrain on " + dataset_path + " timed out");
    }

    forecast::ForecastProviderPtr fresh;
    try {
        fresh = fut.get();
    } catch (const dispatch::RetrainFailure& e) {
        LOG_ERROR("[Engine] Retrain failed, keeping previous forecaster: %s", e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("[Engine] Retrain failed, keeping previous forecaster: %s", e.what());
        throw dispatch::RetrainFailure(std::string("forecaster error: ") + e.what());
    }

    if (!fresh || !fresh->is_loaded()) {
        LOG_ERROR("[Engine] Retrain produced no usable forecaster; keeping previous");
        throw dispatch::RetrainFailure("retrain on " + dataset_path + " returned no usable model");
    }

    std::atomic_store(&provider_, fresh);
    const size_t n = ++retrain_count_;
    LOG_INFO("[Engine] Forecaster swapped (retrain #%zu)", n);
}

} // namespace engine
