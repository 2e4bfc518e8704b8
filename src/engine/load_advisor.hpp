// src/engine/load_advisor.hpp
#pragma once

#include <string>
#include <vector>

namespace engine {

enum class LoadKind {
    Critical,     // never deferred
    Deferrable
};

const char* to_string(LoadKind k);

struct LoadSpec {
    std::string name;
    LoadKind kind = LoadKind::Deferrable;
    double power_kw = 0.0;
};

struct LoadAdvisorParams {
    double carbon_threshold_g_per_kwh = 700.0;
    double price_threshold_per_kwh = 8.0;

    // Reference points for the savings estimates
    double clean_carbon_baseline_g_per_kwh = 400.0;
    double normal_price_per_kwh = 5.0;

    std::vector<LoadSpec> loads = default_loads();

    static std::vector<LoadSpec> default_loads();
};

struct LoadAdvice {
    std::string load;
    LoadKind kind = LoadKind::Deferrable;
    double power_kw = 0.0;
    bool defer = false;
    std::string reason;
    double carbon_savings_g = 0.0;   // per hour of deferral
    double cost_savings = 0.0;       // per hour of deferral
};

struct LoadSheddingPlan {
    std::vector<LoadAdvice> items;
    double total_deferred_kw = 0.0;
    double total_carbon_saved_g = 0.0;
    double total_cost_saved = 0.0;

    bool any_deferred() const { return total_deferred_kw > 0.0; }
    std::string summary() const;
};

/**
 * LoadAdvisor - Demand-response hints attached to each decision
 *
 * A deferrable load is deferred when carbon intensity exceeds the carbon
 * threshold, otherwise when the grid price exceeds the price threshold.
 * Carbon takes precedence, so one load is deferred for one reason only.
 * Advice only: nothing here changes the requested demand.
 */
class LoadAdvisor {
public:
    explicit LoadAdvisor(const LoadAdvisorParams& params = {});

    // Unknown load names are never deferred.
    LoadAdvice advise(const std::string& load_name,
                      double carbon_g_per_kwh,
                      double price_per_kwh) const;

    LoadSheddingPlan recommend(double carbon_g_per_kwh, double price_per_kwh) const;

    const LoadAdvisorParams& params() const { return params_; }

private:
    LoadAdvisorParams params_;

    LoadAdvice advise_(const LoadSpec& load, double carbon_g_per_kwh, double price_per_kwh) const;
};

} // namespace engine
