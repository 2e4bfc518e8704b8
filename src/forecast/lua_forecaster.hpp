// src/forecast/lua_forecaster.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "forecast/forecast_provider.hpp"

namespace forecast {

/**
 * LuaForecaster - Demand forecaster implemented by an operator script
 *
 * Script contract:
 *   forecast(window, horizon) -> { kw_1, ..., kw_horizon }     required
 *       window: array of { t_s, hour, demand_kw, irradiance_w_m2,
 *                          cloud_cover_pct, temperature_c,
 *                          carbon_g_per_kwh, price_per_kwh }
 *   retrain(dataset_path) -> bool                              optional
 *   forecast_init(horizon, lookback) -> bool                   optional
 *
 * Each instance owns its own lua_State. Calls are serialized with an
 * internal mutex because a timed-out prediction may still be running
 * when the next one starts. With a time budget set, a count hook aborts
 * any script call that runs past it, so a hung script releases the
 * interpreter instead of holding it forever.
 */
class LuaForecaster : public ForecastProvider {
public:
    LuaForecaster(std::string script_path, size_t horizon = 6, size_t lookback = 24);
    ~LuaForecaster() override;

    LuaForecaster(const LuaForecaster&) = delete;
    LuaForecaster& operator=(const LuaForecaster&) = delete;

    /**
     * Load the script and run forecast_init if present.
     * @return false on load error (logged); the instance stays unloaded
     */
    bool init();

    std::string name() const override { return "lua:" + script_path_; }
    size_t horizon() const override { return horizon_; }
    size_t lookback() const override { return lookback_; }
    bool is_loaded() const override;

    std::vector<double> predict(const ForecastWindow& recent_window) const override;

    std::shared_ptr<ForecastProvider> retrain(const std::string& dataset_path) const override;

    const std::string& script_path() const { return script_path_; }

    /**
     * Wall-clock budget for forecast() and retrain() calls into the script.
     * A call that exceeds it fails with ModelUnavailable / RetrainFailure.
     * 0 disables the limit. Retrained instances inherit the budget.
     */
    void set_time_budget(double predict_s, double retrain_s);

private:
    std::string script_path_;
    size_t horizon_;
    size_t lookback_;

    double predict_budget_s_{0.0};
    double retrain_budget_s_{0.0};

    mutable std::mutex mtx_;
    lua_State* L_{nullptr};
    mutable std::chrono::steady_clock::time_point deadline_;

    void push_window_(const ForecastWindow& w) const;
    bool call_retrain_(const std::string& dataset_path, std::string& err);

    // Caller holds mtx_
    int pcall_with_budget_(int nargs, int nresults, double budget_s) const;
    static void deadline_hook_(lua_State* L, lua_Debug* ar);
};

} // namespace forecast
