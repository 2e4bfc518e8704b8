// src/config/site_config.cpp
#include "config/site_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace config {

namespace {

// Required numeric key: a missing key is a hard error, not a default
double require_double(const YAML::Node& root, const char* section, const char* key) {
    const YAML::Node sec = root[section];
    if (!sec || !sec[key]) {
        throw std::runtime_error(std::string("missing required key: ") + section + "." + key);
    }
    return sec[key].as<double>();
}

engine::LoadKind parse_load_kind(const std::string& s) {
    if (s == "critical") return engine::LoadKind::Critical;
    if (s == "deferrable") return engine::LoadKind::Deferrable;
    throw std::runtime_error("invalid load type '" + s + "' (expected critical|deferrable)");
}

} // namespace

SiteConfig SiteConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[SiteConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[SiteConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[SiteConfig] Loading site config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        SiteConfig site = get_default();

        // ====================================================================
        // Site metadata
        // ====================================================================
        if (root["site"]) {
            auto s = root["site"];
            site.name = s["name"].as<std::string>(site.name);
            site.location = s["location"].as<std::string>(site.location);
        }

        // ====================================================================
        // Required core parameters
        // ====================================================================
        site.optimizer.solar_capacity_kw = require_double(root, "solar", "capacity_kw");
        site.battery.capacity_kwh = require_double(root, "battery", "capacity_kwh");
        site.battery.max_discharge_kw = require_double(root, "battery", "max_discharge_kw");
        site.battery.max_charge_kw = require_double(root, "battery", "max_charge_kw");
        site.weights.cost_weight = require_double(root, "scoring", "cost_weight");
        site.weights.carbon_weight = require_double(root, "scoring", "carbon_weight");
        site.optimizer.carbon_cost_per_kg = require_double(root, "scoring", "carbon_cost_per_kg");
        site.optimizer.battery_degradation_cost_per_kwh =
            require_double(root, "scoring", "battery_degradation_cost_per_kwh");
        site.optimizer.battery_lifecycle_carbon_g_per_kwh =
            require_double(root, "scoring", "battery_lifecycle_carbon_g_per_kwh");
        site.optimizer.timestep_hours = require_double(root, "simulation", "timestep_hours");

        // ====================================================================
        // Optional solar / battery detail
        // ====================================================================
        {
            auto sol = root["solar"];
            auto& o = site.optimizer;
            o.cloud_derate = sol["cloud_derate"].as<double>(o.cloud_derate);
            o.daylight_start_hour = sol["daylight_start_hour"].as<int>(o.daylight_start_hour);
            o.daylight_end_hour = sol["daylight_end_hour"].as<int>(o.daylight_end_hour);
            o.solar_maintenance_cost_per_kwh =
                sol["maintenance_cost_per_kwh"].as<double>(o.solar_maintenance_cost_per_kwh);
            o.solar_lifecycle_carbon_g_per_kwh =
                sol["lifecycle_carbon_g_per_kwh"].as<double>(o.solar_lifecycle_carbon_g_per_kwh);
        }
        site.battery.initial_soc = root["battery"]["initial_soc"].as<double>(site.battery.initial_soc);

        if (root["simulation"]) {
            auto sim = root["simulation"];
            site.optimizer.charge_from_surplus_solar =
                sim["charge_from_surplus_solar"].as<bool>(site.optimizer.charge_from_surplus_solar);
            site.decision_log_path = sim["decision_log"].as<std::string>(site.decision_log_path);
        }

        // ====================================================================
        // Forecast provider
        // ====================================================================
        if (root["forecast"]) {
            auto f = root["forecast"];
            auto& fs = site.forecast;
            fs.provider = f["provider"].as<std::string>(fs.provider);
            fs.lua_script_path = f["lua_script"].as<std::string>(fs.lua_script_path);
            fs.profile_dataset_path = f["dataset"].as<std::string>(fs.profile_dataset_path);
            fs.horizon = f["horizon"].as<size_t>(fs.horizon);
            fs.lookback = f["lookback"].as<size_t>(fs.lookback);
            fs.predict_timeout_s = f["predict_timeout_s"].as<double>(fs.predict_timeout_s);
            fs.retrain_timeout_s = f["retrain_timeout_s"].as<double>(fs.retrain_timeout_s);
        }

        // ====================================================================
        // Load-shedding advice
        // ====================================================================
        if (root["loads"]) {
            auto l = root["loads"];
            auto& lp = site.loads;
            lp.carbon_threshold_g_per_kwh =
                l["carbon_threshold_g_per_kwh"].as<double>(lp.carbon_threshold_g_per_kwh);
            lp.price_threshold_per_kwh = l["price_threshold_per_kwh"].as<double>(lp.price_threshold_per_kwh);
            lp.clean_carbon_baseline_g_per_kwh =
                l["clean_carbon_baseline_g_per_kwh"].as<double>(lp.clean_carbon_baseline_g_per_kwh);
            lp.normal_price_per_kwh = l["normal_price_per_kwh"].as<double>(lp.normal_price_per_kwh);

            if (l["appliances"]) {
                lp.loads.clear();
                for (const auto& a : l["appliances"]) {
                    engine::LoadSpec spec;
                    spec.name = a["name"].as<std::string>();
                    spec.kind = parse_load_kind(a["type"].as<std::string>("deferrable"));
                    spec.power_kw = a["power_kw"].as<double>();
                    lp.loads.push_back(spec);
                }
            }
        }

        // ====================================================================
        // InfluxDB export
        // ====================================================================
        if (root["influx"]) {
            auto in = root["influx"];
            auto& ic = site.influx;
            ic.url = in["url"].as<std::string>(ic.url);
            ic.token = in["token"].as<std::string>(ic.token);
            ic.org = in["org"].as<std::string>(ic.org);
            ic.bucket = in["bucket"].as<std::string>(ic.bucket);
            ic.write_interval_s = in["write_interval_s"].as<double>(ic.write_interval_s);
            ic.use_wall_clock = in["use_wall_clock"].as<bool>(ic.use_wall_clock);
            ic.enabled = in["enabled"].as<bool>(ic.enabled);
        }
        site.influx.site_tag = site.name;

        site.validate();
        for (const auto& w : site.warnings()) {
            LOG_WARN("[SiteConfig] %s", w.c_str());
        }

        LOG_INFO("[SiteConfig] Successfully loaded: %s", site.name.c_str());
        return site;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[SiteConfig] YAML parse error in ") + yaml_path + ": " + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[SiteConfig] Load error in ") + yaml_path + ": " + e.what()
        );
    }
}

SiteConfig SiteConfig::get_default() {
    SiteConfig site;

    site.name = "Residential 3kW PV + 10kWh (Default)";
    site.location = "";

    // Solar
    site.optimizer.solar_capacity_kw = 3.0;
    site.optimizer.cloud_derate = 0.1;
    site.optimizer.daylight_start_hour = 6;
    site.optimizer.daylight_end_hour = 18;
    site.optimizer.solar_maintenance_cost_per_kwh = 0.0;
    site.optimizer.solar_lifecycle_carbon_g_per_kwh = 0.0;

    // Battery
    site.battery.capacity_kwh = 10.0;
    site.battery.max_discharge_kw = 2.0;
    site.battery.max_charge_kw = 2.0;
    site.battery.initial_soc = 0.8;

    // Scoring
    site.weights.cost_weight = 0.5;
    site.weights.carbon_weight = 0.5;
    site.optimizer.carbon_cost_per_kg = 10.0;
    site.optimizer.battery_degradation_cost_per_kwh = 0.10;
    site.optimizer.battery_lifecycle_carbon_g_per_kwh = 100.0;

    // Simulation
    site.optimizer.timestep_hours = 1.0;
    site.optimizer.charge_from_surplus_solar = false;

    site.influx.site_tag = "default";

    return site;
}

void SiteConfig::validate() const {
    // Solar
    if (!(optimizer.solar_capacity_kw >= 0.0)) {
        throw std::runtime_error("Invalid solar.capacity_kw: must be >= 0");
    }
    if (!(optimizer.cloud_derate >= 0.0 && optimizer.cloud_derate <= 1.0)) {
        throw std::runtime_error("Invalid solar.cloud_derate: must be 0 <= derate <= 1");
    }
    if (optimizer.daylight_start_hour < 0 || optimizer.daylight_end_hour > 24 ||
        optimizer.daylight_start_hour >= optimizer.daylight_end_hour) {
        throw std::runtime_error("Invalid daylight window: 0 <= start < end <= 24");
    }

    // Battery
    if (!(battery.capacity_kwh > 0.0)) {
        throw std::runtime_error("Invalid battery.capacity_kwh: must be > 0");
    }
    if (!(battery.max_discharge_kw >= 0.0)) {
        throw std::runtime_error("Invalid battery.max_discharge_kw: must be >= 0");
    }
    if (!(battery.max_charge_kw >= 0.0)) {
        throw std::runtime_error("Invalid battery.max_charge_kw: must be >= 0");
    }
    if (!(battery.initial_soc >= 0.0 && battery.initial_soc <= 1.0)) {
        throw std::runtime_error("Invalid battery.initial_soc: must be 0 <= soc <= 1");
    }

    // Scoring
    if (!(weights.cost_weight >= 0.0) || !(weights.carbon_weight >= 0.0)) {
        throw std::runtime_error("Invalid scoring weights: must be >= 0");
    }
    if (!(optimizer.carbon_cost_per_kg >= 0.0)) {
        throw std::runtime_error("Invalid scoring.carbon_cost_per_kg: must be >= 0");
    }
    if (!std::isfinite(optimizer.battery_degradation_cost_per_kwh) ||
        !std::isfinite(optimizer.battery_lifecycle_carbon_g_per_kwh)) {
        throw std::runtime_error("Invalid battery scoring parameters: must be finite");
    }

    // Simulation
    if (!(optimizer.timestep_hours > 0.0)) {
        throw std::runtime_error("Invalid simulation.timestep_hours: must be > 0");
    }

    // Forecast
    if (forecast.provider != "profile" && forecast.provider != "lua") {
        throw std::runtime_error("Invalid forecast.provider '" + forecast.provider +
                                 "' (expected profile|lua)");
    }
    if (forecast.horizon == 0) {
        throw std::runtime_error("Invalid forecast.horizon: must be > 0");
    }
    if (!(forecast.predict_timeout_s > 0.0) || !(forecast.retrain_timeout_s > 0.0)) {
        throw std::runtime_error("Invalid forecast timeouts: must be > 0");
    }

    // Loads
    for (const auto& l : loads.loads) {
        if (l.name.empty() || !(l.power_kw >= 0.0)) {
            throw std::runtime_error("Invalid load entry '" + l.name + "': needs a name and power_kw >= 0");
        }
    }

    LOG_DEBUG("[SiteConfig] Validation passed");
}

std::vector<std::string> SiteConfig::warnings() const {
    std::vector<std::string> out;

    const double sum = weights.cost_weight + weights.carbon_weight;
    if (std::fabs(sum - 1.0) > 1e-6) {
        char buf[128];
        std::snprintf(buf, sizeof(buf),
                      "cost_weight + carbon_weight = %.3f (expected 1.0); scores are not normalized", sum);
        out.emplace_back(buf);
    }
    if (battery.max_discharge_kw == 0.0) {
        out.emplace_back("battery.max_discharge_kw is 0; the battery will never supply the site");
    }
    return out;
}

void SiteConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Site Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    if (!location.empty()) {
        LOG_INFO("Location: %s", location.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Solar: %.1f kW (daylight %02d:00-%02d:00)",
             optimizer.solar_capacity_kw, optimizer.daylight_start_hour, optimizer.daylight_end_hour);
    LOG_INFO("Battery: %.1f kWh, discharge %.1f kW, charge %.1f kW, start %.0f%%",
             battery.capacity_kwh, battery.max_discharge_kw, battery.max_charge_kw,
             battery.initial_soc * 100.0);
    LOG_INFO("Weights: cost=%.2f carbon=%.2f (carbon cost %.2f/kg)",
             weights.cost_weight, weights.carbon_weight, optimizer.carbon_cost_per_kg);
    LOG_INFO("Timestep: %.2f h, surplus solar charging: %s",
             optimizer.timestep_hours, optimizer.charge_from_surplus_solar ? "on" : "off");
    LOG_INFO("Forecast: %s (horizon %zu, lookback %zu)",
             forecast.provider.c_str(), forecast.horizon, forecast.lookback);
    LOG_INFO("========================================");
}

} // namespace config
