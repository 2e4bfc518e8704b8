// src/sim/synthetic_day.cpp
#include "sim/synthetic_day.hpp"
#include "utils/logging.hpp"
#include "utils/noise.hpp"

#include <algorithm>
#include <cmath>

namespace sim {

namespace {

constexpr double kPi = 3.14159265358979323846;

bool is_peak_hour(int h) {
    return (h >= 6 && h <= 10) || (h >= 18 && h <= 22);
}

double occupancy(int h, bool weekend) {
    if (weekend) return (h >= 7) ? 0.7 : 0.0;
    if (h >= 6 && h <= 8) return 0.8;
    if (h >= 9 && h <= 17) return 0.3;
    if (h >= 18) return 0.9;
    return 0.0;
}

} // namespace

SyntheticDayGenerator::SyntheticDayGenerator(const SyntheticDayParams& params)
    : params_(params) {}

std::vector<dispatch::ConditionRecord> SyntheticDayGenerator::generate() const {
    utils::NoiseGenerator noise(params_.seed);
    std::vector<dispatch::ConditionRecord> out;
    const int hours = std::max(0, params_.days) * 24;
    out.reserve(static_cast<size_t>(hours));

    double cloud = noise.uniform(10.0, 60.0);

    for (int i = 0; i < hours; ++i) {
        dispatch::ConditionRecord r;
        r.timestamp_s = params_.start_timestamp_s + static_cast<int64_t>(i) * 3600;
        const int h = static_cast<int>((r.timestamp_s % 86400) / 3600);
        const int day_index = static_cast<int>(r.timestamp_s / 86400);
        // 1970-01-01 was a Thursday
        const bool weekend = ((day_index + 3) % 7) >= 5;
        r.hour_of_day = h;

        // ---- Weather ----
        cloud = std::clamp(cloud + noise.gaussian(8.0), 0.0, 100.0);
        r.cloud_cover_pct = cloud;

        double irradiance = 0.0;
        if (h >= 6 && h < 18) {
            const double phase = std::sin(kPi * (h - 6 + 0.5) / 12.0);
            irradiance = params_.peak_irradiance_w_m2 * phase * (1.0 - 0.75 * cloud / 100.0);
        }
        r.solar_irradiance_w_m2 = std::max(0.0, irradiance);

        r.temperature_c = params_.mean_temperature_c +
                          6.0 * std::sin(2.0 * kPi * h / 24.0 - kPi / 2.0) +
                          noise.gaussian(1.0);

        // ---- Demand ----
        const double occ = occupancy(h, weekend);
        const double daylight = (h >= 6 && h <= 18) ? 0.3 : 1.0;
        const double lighting = std::clamp(params_.lighting_max_kw * occ * daylight *
                                           (1.0 + noise.gaussian(0.1)),
                                           0.0, params_.lighting_max_kw);

        double appliances = params_.fridge_base_kw + 0.05 * std::sin(2.0 * kPi * h / 4.0);
        if (h >= 18 && h <= 23) appliances += 0.1;                 // TV
        if (h >= 7 && h <= 9) appliances += 0.8;                   // kitchen
        else if (h >= 12 && h <= 14) appliances += 0.6;
        else if (h >= 18 && h <= 20) appliances += 1.0;
        if (noise.chance(weekend ? 0.1 : 0.05)) appliances += 1.5; // washing machine
        appliances = std::max(0.0, appliances + noise.gaussian(0.05));

        const double deviation = std::abs(r.temperature_c - params_.hvac_comfort_c);
        double hvac = 0.0;
        if (deviation > 2.0) {
            hvac = std::clamp(0.3 + (deviation - 2.0) * 0.15 + noise.gaussian(0.05), 0.0, 1.5);
            if (h >= 23 || h <= 6) hvac *= 0.3;
        }

        r.demand_kw = lighting + appliances + hvac;

        // ---- Grid ----
        const double carbon_shape = is_peak_hour(h) ? 1.15 : (h < 6 ? 0.9 : 1.0);
        r.carbon_intensity_g_per_kwh = std::max(
            100.0, params_.base_carbon_g_per_kwh * carbon_shape + noise.gaussian(25.0));

        if (is_peak_hour(h)) r.grid_price_per_kwh = params_.peak_price_per_kwh;
        else if (h < 6 || h == 23) r.grid_price_per_kwh = params_.night_price_per_kwh;
        else r.grid_price_per_kwh = params_.offpeak_price_per_kwh;

        out.push_back(r);
    }

    LOG_DEBUG("[Synthetic] Generated %zu hourly records (seed=%llu)",
              out.size(), static_cast<unsigned long long>(params_.seed));
    return out;
}

} // namespace sim
