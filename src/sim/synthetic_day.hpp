// src/sim/synthetic_day.hpp
#pragma once

#include "dispatch/dispatch_types.hpp"
#include <cstdint>
#include <vector>

namespace sim {

struct SyntheticDayParams {
    int64_t start_timestamp_s = 1704067200;   // 2024-01-01T00:00:00Z
    int days = 1;
    uint64_t seed = 42;                       // 0 = non-deterministic

    // Household load shape (kW)
    double lighting_max_kw = 0.2;
    double fridge_base_kw = 0.15;
    double hvac_comfort_c = 24.0;

    // Weather
    double peak_irradiance_w_m2 = 950.0;
    double mean_temperature_c = 27.0;

    // Grid
    double base_carbon_g_per_kwh = 650.0;
    double offpeak_price_per_kwh = 5.0;
    double peak_price_per_kwh = 8.5;
    double night_price_per_kwh = 3.5;
};

/**
 * SyntheticDayGenerator - Hourly condition series for demos and tests
 *
 * Demand is lighting + appliances + HVAC driven by occupancy and
 * temperature; irradiance follows a daylight half-sine attenuated by
 * cloud cover; carbon intensity and price peak in the morning and
 * evening. Same seed, same series.
 */
class SyntheticDayGenerator {
public:
    explicit SyntheticDayGenerator(const SyntheticDayParams& params = {});

    std::vector<dispatch::ConditionRecord> generate() const;

private:
    SyntheticDayParams params_;
};

} // namespace sim
