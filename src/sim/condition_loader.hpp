// src/sim/condition_loader.hpp
#pragma once

#include "dispatch/dispatch_types.hpp"
#include <string>
#include <vector>

namespace sim {

/**
 * Load a condition time series from the integrated dataset CSV.
 *
 * Recognized columns (first alias present wins):
 *   timestamp                                  required
 *   demand_kw | total_energy_kwh               required
 *   shortwave_radiation | solar_irradiance_w_m2 | solar_radiation
 *   cloud_cover | cloud_cover_pct
 *   temperature | temperature_c | outdoor_temperature
 *   carbon_intensity | carbon_intensity_g_per_kwh
 *   grid_price_per_kwh | grid_price
 *   hour | hour_of_day                         (derived from timestamp if absent)
 *
 * Hourly datasets store energy per hour, which equals mean power in kW.
 * Missing numeric cells load as NaN so the optimizer can flag the step.
 *
 * @throws std::runtime_error if the file cannot be opened, a required
 *         column is missing, or a timestamp cannot be parsed
 */
std::vector<dispatch::ConditionRecord> load_conditions_csv(const std::string& path);

/**
 * Write a condition series in the same column layout load_conditions_csv reads.
 * @return false if the file cannot be opened
 */
bool save_conditions_csv(const std::vector<dispatch::ConditionRecord>& records,
                         const std::string& path);

/**
 * True if timestamps never decrease.
 */
bool is_time_ordered(const std::vector<dispatch::ConditionRecord>& records);

} // namespace sim
