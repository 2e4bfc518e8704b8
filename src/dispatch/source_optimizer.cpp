// src/dispatch/source_optimizer.cpp
#include "dispatch/source_optimizer.hpp"
#include "dispatch/errors.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace dispatch {

SourceOptimizer::SourceOptimizer(const OptimizerParams& params)
    : params_(params) {}

double SourceOptimizer::solar_output_factor(const ConditionRecord& c) const {
    const int h = c.hour_of_day;
    if (h < params_.daylight_start_hour || h >= params_.daylight_end_hour) {
        return 0.0;
    }

    const double irradiance = std::max(0.0, c.solar_irradiance_w_m2);
    const double cloud = std::clamp(c.cloud_cover_pct, 0.0, 100.0);
    const double cloud_factor = 1.0 - (cloud / 100.0) * params_.cloud_derate;

    return std::clamp((irradiance / 1000.0) * cloud_factor, 0.0, 1.0);
}

double SourceOptimizer::solar_available_kw(const ConditionRecord& c) const {
    return params_.solar_capacity_kw * solar_output_factor(c);
}

double SourceOptimizer::carbon_cost_equivalent(double carbon_g) const {
    return (carbon_g / 1000.0) * params_.carbon_cost_per_kg;
}

double SourceOptimizer::grid_score(const ConditionRecord& c, const Weights& w) const {
    return w.cost_weight * c.grid_price_per_kwh +
           w.carbon_weight * carbon_cost_equivalent(c.carbon_intensity_g_per_kwh);
}

double SourceOptimizer::battery_score(const Weights& w) const {
    return w.cost_weight * params_.battery_degradation_cost_per_kwh +
           w.carbon_weight * carbon_cost_equivalent(params_.battery_lifecycle_carbon_g_per_kwh);
}

void SourceOptimizer::fill_metrics_(const Allocation& alloc,
                                    const ConditionRecord& c,
                                    DecisionMetrics& m) const {
    const double dt = params_.timestep_hours;
    double cost = 0.0;
    double carbon = 0.0;

    for (const auto& [source, kw] : alloc) {
        const double kwh = kw * dt;
        switch (source) {
            case Source::Solar:
                cost += kwh * params_.solar_maintenance_cost_per_kwh;
                carbon += kwh * params_.solar_lifecycle_carbon_g_per_kwh;
                break;
            case Source::Battery:
                cost += kwh * params_.battery_degradation_cost_per_kwh;
                carbon += kwh * params_.battery_lifecycle_carbon_g_per_kwh;
                break;
            case Source::Grid:
                cost += kwh * c.grid_price_per_kwh;
                carbon += kwh * c.carbon_intensity_g_per_kwh;
                break;
        }
    }

    m.estimated_cost = cost;
    m.estimated_carbon_g = carbon;
}

Decision SourceOptimizer::optimize(double power_needed_kw,
                                   const ConditionRecord& conditions,
                                   plant::BatteryModel& battery,
                                   const Weights& weights) const {
    if (std::isnan(power_needed_kw) || power_needed_kw < 0.0) {
        throw InvalidDemand("power_needed_kw must be a non-negative number, got " +
                            std::to_string(power_needed_kw));
    }
    if (std::isinf(power_needed_kw)) {
        throw InvalidDemand("power_needed_kw must be finite");
    }
    if (!std::isfinite(conditions.solar_irradiance_w_m2) ||
        !std::isfinite(conditions.cloud_cover_pct) ||
        !std::isfinite(conditions.carbon_intensity_g_per_kwh) ||
        !std::isfinite(conditions.grid_price_per_kwh)) {
        throw ModelUnavailable("conditions at t=" + std::to_string(conditions.timestamp_s) +
                               " lack solar or market inputs");
    }

    const double dt = params_.timestep_hours;
    Decision d;
    DecisionMetrics& m = d.metrics;

    m.solar_available_kw = solar_available_kw(conditions);
    m.battery_headroom_kw = battery.discharge_headroom_kw(dt);
    m.grid_score = grid_score(conditions, weights);
    m.battery_score = battery_score(weights);

    if (power_needed_kw == 0.0) {
        m.battery_charge_after_kwh = battery.charge_kwh();
        return d;
    }

    // ---- Stage 1: solar first ----
    const double solar_kw = std::min(power_needed_kw, m.solar_available_kw);
    double remainder_kw = power_needed_kw - solar_kw;
    if (solar_kw > 0.0) {
        d.allocation.emplace_back(Source::Solar, solar_kw);
    }

    // ---- Stage 2: battery vs grid for the remainder ----
    double battery_kw = 0.0;
    double grid_kw = 0.0;
    if (remainder_kw > 0.0) {
        const bool battery_preferred = m.battery_score <= m.grid_score;
        if (battery_preferred && m.battery_headroom_kw > 0.0) {
            const double requested_kw = std::min(remainder_kw, m.battery_headroom_kw);
            // ---- Stage 3: apply; downstream math uses the realized value ----
            battery_kw = battery.apply(requested_kw, dt);
        }
        grid_kw = remainder_kw - battery_kw;
        if (grid_kw < 0.0) grid_kw = 0.0;

        if (battery_kw > 0.0) d.allocation.emplace_back(Source::Battery, battery_kw);
        if (grid_kw > 0.0) d.allocation.emplace_back(Source::Grid, grid_kw);
    }

    // Optional surplus solar into storage
    if (params_.charge_from_surplus_solar) {
        const double surplus_kw = m.solar_available_kw - solar_kw;
        if (surplus_kw > 0.0) {
            const double want_kw = std::min(surplus_kw, battery.charge_headroom_kw(dt));
            if (want_kw > 0.0) {
                m.battery_charged_kw = -battery.apply(-want_kw, dt);
            }
        }
    }

    fill_metrics_(d.allocation, conditions, m);
    m.battery_charge_after_kwh = battery.charge_kwh();

    LOG_DEBUG("[Optimizer] demand=%.3f kW solar=%.3f battery=%.3f grid=%.3f "
              "(scores grid=%.4f battery=%.4f) cost=%.4f carbon=%.1f g",
              power_needed_kw, solar_kw, battery_kw, grid_kw,
              m.grid_score, m.battery_score, m.estimated_cost, m.estimated_carbon_g);

    return d;
}

Decision SourceOptimizer::grid_only(double power_needed_kw,
                                    const ConditionRecord& conditions,
                                    const plant::BatteryModel& battery) const {
    if (std::isnan(power_needed_kw) || power_needed_kw < 0.0 || std::isinf(power_needed_kw)) {
        throw InvalidDemand("power_needed_kw must be a finite non-negative number");
    }

    Decision d;
    if (power_needed_kw > 0.0) {
        d.allocation.emplace_back(Source::Grid, power_needed_kw);
    }

    ConditionRecord priced = conditions;
    if (!std::isfinite(priced.grid_price_per_kwh)) priced.grid_price_per_kwh = 0.0;
    if (!std::isfinite(priced.carbon_intensity_g_per_kwh)) priced.carbon_intensity_g_per_kwh = 0.0;

    fill_metrics_(d.allocation, priced, d.metrics);
    d.metrics.battery_headroom_kw = battery.discharge_headroom_kw(params_.timestep_hours);
    d.metrics.battery_charge_after_kwh = battery.charge_kwh();
    return d;
}

} // namespace dispatch
