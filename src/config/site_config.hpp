// src/config/site_config.hpp
#pragma once

#include <string>
#include <vector>

#include "dispatch/dispatch_types.hpp"
#include "dispatch/source_optimizer.hpp"
#include "engine/load_advisor.hpp"
#include "plant/battery_model.hpp"
#include "utils/influx.hpp"

namespace config {

struct ForecastSettings {
    std::string provider = "profile";      // "profile" | "lua"
    std::string lua_script_path = "config/lua/demand_forecast.lua";
    std::string profile_dataset_path;      // optional seed dataset for the profile forecaster
    size_t horizon = 6;
    size_t lookback = 24;
    double predict_timeout_s = 2.0;
    double retrain_timeout_s = 120.0;
};

/**
 * SiteConfig - Loads site parameters from YAML files
 *
 * Usage:
 *   auto site = SiteConfig::load("config/sites/default.yaml");
 *   engine.initialize(site, provider);
 *
 * Required keys (an error if the file exists but lacks them):
 *   solar.capacity_kw, battery.capacity_kwh, battery.max_discharge_kw,
 *   battery.max_charge_kw, scoring.cost_weight, scoring.carbon_weight,
 *   scoring.carbon_cost_per_kg, scoring.battery_degradation_cost_per_kwh,
 *   scoring.battery_lifecycle_carbon_g_per_kwh, simulation.timestep_hours
 *
 * Falls back to defaults if the file is not found.
 */
class SiteConfig {
public:
    std::string name;
    std::string location;

    plant::BatteryParams battery;
    dispatch::OptimizerParams optimizer;
    dispatch::Weights weights;
    ForecastSettings forecast;
    engine::LoadAdvisorParams loads;
    utils::InfluxClient::Config influx;

    // Decision log persistence
    std::string decision_log_path = "decision_log.csv";

    /**
     * Load site config from YAML file
     * @param yaml_path Path to YAML file
     * @return SiteConfig with loaded parameters
     * @throws std::runtime_error if file exists but is invalid or incomplete
     */
    static SiteConfig load(const std::string& yaml_path);

    /**
     * Built-in 3 kW solar / 10 kWh battery residential site.
     */
    static SiteConfig get_default();

    /**
     * Validate parameters
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    /**
     * Non-fatal findings (e.g. weights not summing to 1). Empty if none.
     */
    std::vector<std::string> warnings() const;

    double timestep_hours() const { return optimizer.timestep_hours; }

    /**
     * Print summary of configuration to the log
     */
    void print_summary() const;

    SiteConfig() = default;
};

} // namespace config
