// src/engine/decision_log.cpp
#include "engine/decision_log.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/timestamp.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace engine {

void DecisionLog::append(DecisionRecord record) {
    std::lock_guard<std::mutex> lock(mtx_);
    records_.push_back(std::move(record));
}

size_t DecisionLog::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.size();
}

std::optional<DecisionRecord> DecisionLog::latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (records_.empty()) return std::nullopt;
    return records_.back();
}

std::vector<DecisionRecord> DecisionLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_;
}

std::vector<DecisionRecord> DecisionLog::between(int64_t from_s, int64_t to_s) const {
    std::vector<DecisionRecord> out;
    if (from_s > to_s) return out;

    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& r : records_) {
        if (r.timestamp_s >= from_s && r.timestamp_s <= to_s) {
            out.push_back(r);
        }
    }
    return out;
}

std::string DecisionLog::csv_header() {
    return "timestamp,requested_kw,solar_kw,battery_kw,grid_kw,cost,carbon_g,"
           "battery_kwh,battery_charged_kw,cost_weight,carbon_weight,fallback,"
           "forecast_provider,forecast_kw,deferred_kw,load_shedding,reasoning";
}

std::string DecisionLog::csv_row(const DecisionRecord& r) {
    using dispatch::Source;

    std::ostringstream forecast;
    forecast << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < r.forecast_kw.size(); ++i) {
        if (i) forecast << ";";
        forecast << r.forecast_kw[i];
    }

    std::ostringstream row;
    row << std::fixed << std::setprecision(4)
        << utils::format_timestamp(r.timestamp_s) << ","
        << r.requested_power_kw << ","
        << dispatch::allocated_kw(r.allocation, Source::Solar) << ","
        << dispatch::allocated_kw(r.allocation, Source::Battery) << ","
        << dispatch::allocated_kw(r.allocation, Source::Grid) << ","
        << r.metrics.estimated_cost << ","
        << r.metrics.estimated_carbon_g << ","
        << r.metrics.battery_charge_after_kwh << ","
        << r.metrics.battery_charged_kw << ","
        << r.weights.cost_weight << ","
        << r.weights.carbon_weight << ","
        << (r.fallback ? 1 : 0) << ","
        << utils::CsvReader::quote(r.forecast_provider) << ","
        << forecast.str() << ","
        << r.load_shedding.total_deferred_kw << ","
        << utils::CsvReader::quote(r.load_shedding.summary()) << ","
        << utils::CsvReader::quote(r.reasoning);
    return row.str();
}

bool DecisionLog::save_csv(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) {
        LOG_ERROR("[DecisionLog] Failed to open %s for writing", path.c_str());
        return false;
    }

    const auto records = snapshot();
    out << csv_header() << "\n";
    for (const auto& r : records) {
        out << csv_row(r) << "\n";
    }

    LOG_INFO("[DecisionLog] Wrote %zu decisions to %s", records.size(), path.c_str());
    return static_cast<bool>(out);
}

} // namespace engine
