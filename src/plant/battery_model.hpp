// src/plant/battery_model.hpp
#pragma once

namespace plant {

struct BatteryParams {
    double capacity_kwh = 10.0;
    double max_discharge_kw = 2.0;
    double max_charge_kw = 2.0;
    double initial_soc = 0.8;     // fraction of capacity at start
};

/**
 * BatteryModel - Site storage state holder
 *
 * Invariant: 0 <= charge_kwh <= capacity_kwh after every call.
 * Over-requests are clamped silently and the realized power is returned;
 * callers must use the returned value, not the requested one.
 *
 * Sign convention: positive power = discharge (battery supplies the site),
 * negative power = charge.
 *
 * Plain value type: copy it to run an independent simulation.
 */
class BatteryModel {
public:
    BatteryModel(const BatteryParams& params = {}, double timestep_hours = 1.0);

    double discharge_headroom_kw() const { return discharge_headroom_kw(dt_h_); }
    double discharge_headroom_kw(double timestep_hours) const;

    double charge_headroom_kw() const { return charge_headroom_kw(dt_h_); }
    double charge_headroom_kw(double timestep_hours) const;

    /**
     * Apply a charge/discharge request for one timestep.
     * @return signed power actually applied (same sign as the request, or 0)
     */
    double apply(double power_kw) { return apply(power_kw, dt_h_); }
    double apply(double power_kw, double timestep_hours);

    void set_charge_kwh(double charge_kwh);

    double charge_kwh() const { return charge_kwh_; }
    double capacity_kwh() const { return params_.capacity_kwh; }
    double max_discharge_kw() const { return params_.max_discharge_kw; }
    double max_charge_kw() const { return params_.max_charge_kw; }
    double timestep_hours() const { return dt_h_; }
    double soc_pct() const;

    const BatteryParams& params() const { return params_; }

private:
    BatteryParams params_;
    double dt_h_;
    double charge_kwh_;
};

} // namespace plant
