// src/engine/load_advisor.cpp
#include "engine/load_advisor.hpp"

#include <utility>
#include <cstdio>

namespace engine {

const char* to_string(LoadKind k) {
    return k == LoadKind::Critical ? "critical" : "deferrable";
}

std::vector<LoadSpec> LoadAdvisorParams::default_loads() {
    return {
        {"lights",          LoadKind::Critical,   0.2},
        {"router",          LoadKind::Critical,   0.05},
        {"refrigerator",    LoadKind::Critical,   0.15},
        {"washing_machine", LoadKind::Deferrable, 1.5},
        {"ev_charger",      LoadKind::Deferrable, 3.0},
        {"air_conditioner", LoadKind::Deferrable, 2.0},
        {"dishwasher",      LoadKind::Deferrable, 1.2},
    };
}

std::string LoadSheddingPlan::summary() const {
    if (!any_deferred()) {
        return "All loads can proceed";
    }
    char buf[128];
    if (total_carbon_saved_g > 0.0) {
        std::snprintf(buf, sizeof(buf), "Defer %.1f kW to save %.0fg CO2",
                      total_deferred_kw, total_carbon_saved_g);
    } else {
        std::snprintf(buf, sizeof(buf), "Defer %.1f kW to save %.2f",
                      total_deferred_kw, total_cost_saved);
    }
    return buf;
}

LoadAdvisor::LoadAdvisor(const LoadAdvisorParams& params) : params_(params) {}

LoadAdvice LoadAdvisor::advise(const std::string& load_name,
                               double carbon_g_per_kwh,
                               double price_per_kwh) const {
    for (const auto& l : params_.loads) {
        if (l.name == load_name) {
            return advise_(l, carbon_g_per_kwh, price_per_kwh);
        }
    }
    LoadAdvice a;
    a.load = load_name;
    a.reason = "Unknown load";
    return a;
}

LoadAdvice LoadAdvisor::advise_(const LoadSpec& load,
                                double carbon_g_per_kwh,
                                double price_per_kwh) const {
    LoadAdvice a;
    a.load = load.name;
    a.kind = load.kind;
    a.power_kw = load.power_kw;

    char buf[160];

    if (load.kind == LoadKind::Critical) {
        a.reason = "Critical load - cannot defer";
        return a;
    }

    // NaN compares false, so missing market data never defers anything
    if (carbon_g_per_kwh > params_.carbon_threshold_g_per_kwh) {
        a.defer = true;
        a.carbon_savings_g = load.power_kw *
                             (carbon_g_per_kwh - params_.clean_carbon_baseline_g_per_kwh);
        std::snprintf(buf, sizeof(buf), "High carbon intensity (%.0f g/kWh) - defer until cleaner",
                      carbon_g_per_kwh);
        a.reason = buf;
        return a;
    }

    if (price_per_kwh > params_.price_threshold_per_kwh) {
        a.defer = true;
        a.cost_savings = load.power_kw * (price_per_kwh - params_.normal_price_per_kwh);
        std::snprintf(buf, sizeof(buf), "High grid price (%.2f/kWh) - defer until cheaper",
                      price_per_kwh);
        a.reason = buf;
        return a;
    }

    a.reason = "Good conditions - proceed with load";
    return a;
}

LoadSheddingPlan LoadAdvisor::recommend(double carbon_g_per_kwh, double price_per_kwh) const {
    LoadSheddingPlan plan;
    plan.items.reserve(params_.loads.size());

    for (const auto& l : params_.loads) {
        LoadAdvice a = advise_(l, carbon_g_per_kwh, price_per_kwh);
        if (a.defer) {
            plan.total_deferred_kw += a.power_kw;
            plan.total_carbon_saved_g += a.carbon_savings_g;
            plan.total_cost_saved += a.cost_savings;
        }
        plan.items.push_back(std::move(a));
    }
    return plan;
}

} // namespace engine
