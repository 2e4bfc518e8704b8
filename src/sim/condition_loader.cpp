// src/sim/condition_loader.cpp
#include "sim/condition_loader.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/timestamp.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace sim {

namespace {

double numeric_or_nan(const std::vector<std::string>& row, int idx) {
    double v = 0.0;
    if (idx < 0 || !utils::CsvReader::try_double(utils::CsvReader::cell(row, idx), v)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return v;
}

} // namespace

std::vector<dispatch::ConditionRecord> load_conditions_csv(const std::string& path) {
    utils::CsvReader csv;
    if (!csv.open(path)) {
        throw std::runtime_error("[Conditions] Cannot open dataset: " + path);
    }

    const int c_ts = csv.col_any({"timestamp", "time"});
    const int c_demand = csv.col_any({"demand_kw", "total_energy_kwh"});
    const int c_irr = csv.col_any({"shortwave_radiation", "solar_irradiance_w_m2", "solar_radiation"});
    const int c_cloud = csv.col_any({"cloud_cover", "cloud_cover_pct"});
    const int c_temp = csv.col_any({"temperature", "temperature_c", "outdoor_temperature"});
    const int c_carbon = csv.col_any({"carbon_intensity", "carbon_intensity_g_per_kwh"});
    const int c_price = csv.col_any({"grid_price_per_kwh", "grid_price"});
    const int c_hour = csv.col_any({"hour", "hour_of_day"});

    if (c_ts < 0) {
        throw std::runtime_error("[Conditions] Missing 'timestamp' column in " + path);
    }
    if (c_demand < 0) {
        throw std::runtime_error("[Conditions] Missing 'demand_kw'/'total_energy_kwh' column in " + path);
    }
    if (c_irr < 0) LOG_WARN("[Conditions] No irradiance column in %s; solar will be unscored", path.c_str());
    if (c_carbon < 0) LOG_WARN("[Conditions] No carbon intensity column in %s", path.c_str());
    if (c_price < 0) LOG_WARN("[Conditions] No grid price column in %s", path.c_str());

    std::vector<dispatch::ConditionRecord> out;
    std::vector<std::string> row;
    while (csv.read_row(row)) {
        dispatch::ConditionRecord r;

        const std::string ts = utils::CsvReader::cell(row, c_ts);
        if (!utils::parse_timestamp(ts, r.timestamp_s)) {
            throw std::runtime_error("[Conditions] Bad timestamp '" + ts + "' at " + path +
                                     ":" + std::to_string(csv.line_number()));
        }

        r.demand_kw = numeric_or_nan(row, c_demand);
        r.solar_irradiance_w_m2 = numeric_or_nan(row, c_irr);
        r.cloud_cover_pct = c_cloud >= 0 ? numeric_or_nan(row, c_cloud) : 0.0;
        r.temperature_c = numeric_or_nan(row, c_temp);
        r.carbon_intensity_g_per_kwh = numeric_or_nan(row, c_carbon);
        r.grid_price_per_kwh = numeric_or_nan(row, c_price);

        double hour = numeric_or_nan(row, c_hour);
        r.hour_of_day = std::isfinite(hour) ? static_cast<int>(hour) % 24
                                            : utils::hour_of_day(r.timestamp_s);

        out.push_back(r);
    }

    LOG_INFO("[Conditions] Loaded %zu records from %s", out.size(), path.c_str());
    if (!is_time_ordered(out)) {
        LOG_WARN("[Conditions] %s is not in time order", path.c_str());
    }
    return out;
}

bool save_conditions_csv(const std::vector<dispatch::ConditionRecord>& records,
                         const std::string& path) {
    std::ofstream csv(path);
    if (!csv) {
        LOG_ERROR("[Conditions] Failed to open CSV: %s", path.c_str());
        return false;
    }

    csv << "timestamp,demand_kw,shortwave_radiation,cloud_cover,temperature,"
        << "carbon_intensity,grid_price_per_kwh,hour\n";
    csv << std::fixed << std::setprecision(4);

    for (const auto& r : records) {
        csv << utils::format_timestamp(r.timestamp_s) << ","
            << r.demand_kw << ","
            << r.solar_irradiance_w_m2 << ","
            << r.cloud_cover_pct << ","
            << r.temperature_c << ","
            << r.carbon_intensity_g_per_kwh << ","
            << r.grid_price_per_kwh << ","
            << r.hour_of_day << "\n";
    }
    return true;
}

bool is_time_ordered(const std::vector<dispatch::ConditionRecord>& records) {
    for (size_t i = 1; i < records.size(); ++i) {
        if (records[i].timestamp_s < records[i - 1].timestamp_s) return false;
    }
    return true;
}

} // namespace sim
