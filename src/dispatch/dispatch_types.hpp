// src/dispatch/dispatch_types.hpp
#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace dispatch {

enum class Source : int {
    Solar = 0,
    Battery = 1,
    Grid = 2
};

inline const char* to_string(Source s) {
    switch (s) {
        case Source::Solar:   return "solar";
        case Source::Battery: return "battery";
        case Source::Grid:    return "grid";
    }
    return "unknown";
}

// One timestep's environment/market snapshot. Units are embedded in field names.
struct ConditionRecord {
    int64_t timestamp_s = 0;                 // Unix seconds, UTC
    double demand_kw = 0.0;                  // site load over the timestep
    double solar_irradiance_w_m2 = 0.0;      // shortwave radiation
    double cloud_cover_pct = 0.0;            // 0..100
    double temperature_c = std::numeric_limits<double>::quiet_NaN();
    double carbon_intensity_g_per_kwh = 0.0;
    double grid_price_per_kwh = 0.0;
    int hour_of_day = 0;                     // 0..23, local site time
};

struct Weights {
    double cost_weight = 0.5;
    double carbon_weight = 0.5;
};

using AllocationEntry = std::pair<Source, double>;   // (source, power_kw)
using Allocation = std::vector<AllocationEntry>;

inline double allocation_total_kw(const Allocation& a) {
    double sum = 0.0;
    for (const auto& e : a) sum += e.second;
    return sum;
}

inline double allocated_kw(const Allocation& a, Source s) {
    double sum = 0.0;
    for (const auto& e : a) {
        if (e.first == s) sum += e.second;
    }
    return sum;
}

struct DecisionMetrics {
    double estimated_cost = 0.0;
    double estimated_carbon_g = 0.0;
    double battery_charge_after_kwh = 0.0;

    // Diagnostics, carried into the decision log
    double solar_available_kw = 0.0;
    double battery_headroom_kw = 0.0;
    double grid_score = 0.0;
    double battery_score = 0.0;
    double battery_charged_kw = 0.0;   // surplus solar routed into storage
};

struct Decision {
    Allocation allocation;
    DecisionMetrics metrics;
};

} // namespace dispatch
