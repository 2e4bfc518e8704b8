// src/plant/battery_model.cpp
#include "battery_model.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace plant {

BatteryModel::BatteryModel(const BatteryParams& params, double timestep_hours)
    : params_(params),
      dt_h_(timestep_hours),
      charge_kwh_(0.0) {
    params_.capacity_kwh = std::max(0.0, params_.capacity_kwh);
    params_.max_discharge_kw = std::max(0.0, params_.max_discharge_kw);
    params_.max_charge_kw = std::max(0.0, params_.max_charge_kw);
    set_charge_kwh(params_.capacity_kwh * std::clamp(params_.initial_soc, 0.0, 1.0));
}

double BatteryModel::discharge_headroom_kw(double timestep_hours) const {
    if (!(timestep_hours > 0.0)) return 0.0;
    return std::min(params_.max_discharge_kw, charge_kwh_ / timestep_hours);
}

double BatteryModel::charge_headroom_kw(double timestep_hours) const {
    if (!(timestep_hours > 0.0)) return 0.0;
    return std::min(params_.max_charge_kw,
                    (params_.capacity_kwh - charge_kwh_) / timestep_hours);
}

double BatteryModel::apply(double power_kw, double timestep_hours) {
    if (!(timestep_hours > 0.0) || !std::isfinite(power_kw) || power_kw == 0.0) {
        return 0.0;
    }

    double actual_kw = 0.0;
    if (power_kw > 0.0) {
        actual_kw = std::min(power_kw, discharge_headroom_kw(timestep_hours));
        charge_kwh_ -= actual_kw * timestep_hours;
    } else {
        actual_kw = -std::min(-power_kw, charge_headroom_kw(timestep_hours));
        charge_kwh_ -= actual_kw * timestep_hours;
    }

    // Floating-point residue from kW*h round trips
    charge_kwh_ = std::clamp(charge_kwh_, 0.0, params_.capacity_kwh);

    if (actual_kw != power_kw) {
        LOG_DEBUG("[Battery] Request %.4f kW clamped to %.4f kW (charge=%.4f/%.2f kWh)",
                  power_kw, actual_kw, charge_kwh_, params_.capacity_kwh);
    }
    return actual_kw;
}

void BatteryModel::set_charge_kwh(double charge_kwh) {
    if (!std::isfinite(charge_kwh)) charge_kwh = 0.0;
    charge_kwh_ = std::clamp(charge_kwh, 0.0, params_.capacity_kwh);
}

double BatteryModel::soc_pct() const {
    if (params_.capacity_kwh <= 0.0) return 0.0;
    return 100.0 * charge_kwh_ / params_.capacity_kwh;
}

} // namespace plant
