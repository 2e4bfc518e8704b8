// src/forecast/profile_forecaster.cpp
#include "forecast/profile_forecaster.hpp"
#include "dispatch/errors.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"
#include "utils/timestamp.hpp"

#include <algorithm>
#include <cmath>

namespace forecast {

HourlyProfile ProfileForecaster::default_profile() {
    return HourlyProfile{
        0.4, 0.3, 0.3, 0.3, 0.3, 0.4,
        0.8, 1.2, 1.5, 1.2, 1.0, 1.1,
        1.3, 1.2, 1.1, 1.0, 1.2, 1.5,
        2.0, 2.2, 2.0, 1.5, 1.0, 0.6
    };
}

ProfileForecaster::ProfileForecaster(size_t horizon,
                                     size_t lookback,
                                     const HourlyProfile& profile,
                                     bool loaded)
    : horizon_(horizon == 0 ? 1 : horizon),
      lookback_(lookback),
      profile_(profile),
      loaded_(loaded) {}

std::vector<double> ProfileForecaster::predict(const ForecastWindow& recent_window) const {
    if (!loaded_) {
        throw dispatch::ModelUnavailable("[Forecast] profile forecaster not loaded");
    }

    int next_hour = 0;
    double scale = 1.0;

    if (!recent_window.empty()) {
        next_hour = (recent_window.back().hour_of_day + 1) % 24;

        const size_t n = (lookback_ > 0) ? std::min(lookback_, recent_window.size())
                                         : recent_window.size();
        double observed = 0.0;
        double expected = 0.0;
        for (size_t i = recent_window.size() - n; i < recent_window.size(); ++i) {
            const auto& r = recent_window[i];
            if (!std::isfinite(r.demand_kw) || r.demand_kw < 0.0) continue;
            observed += r.demand_kw;
            expected += profile_[static_cast<size_t>(((r.hour_of_day % 24) + 24) % 24)];
        }
        if (observed > 0.0 && expected > 0.0) {
            scale = observed / expected;
        }
    }

    std::vector<double> out(horizon_);
    for (size_t k = 0; k < horizon_; ++k) {
        out[k] = profile_[(static_cast<size_t>(next_hour) + k) % 24] * scale;
    }
    return out;
}

std::shared_ptr<ProfileForecaster> ProfileForecaster::from_dataset(const std::string& dataset_path,
                                                                   size_t horizon,
                                                                   size_t lookback) {
    ProfileForecaster seed(horizon, lookback, default_profile(), true);
    auto fresh = std::dynamic_pointer_cast<ProfileForecaster>(seed.retrain(dataset_path));
    fresh->generation_ = 0;
    return fresh;
}

std::shared_ptr<ForecastProvider> ProfileForecaster::retrain(const std::string& dataset_path) const {
    utils::CsvReader csv;
    if (!csv.open(dataset_path)) {
        throw dispatch::RetrainFailure("cannot open dataset: " + dataset_path);
    }

    const int c_demand = csv.col_any({"demand_kw", "total_energy_kwh"});
    const int c_hour = csv.col_any({"hour", "hour_of_day"});
    const int c_ts = csv.col_any({"timestamp", "time"});

    if (c_demand < 0) {
        throw dispatch::RetrainFailure("dataset has no demand column: " + dataset_path);
    }
    if (c_hour < 0 && c_ts < 0) {
        throw dispatch::RetrainFailure("dataset has neither hour nor timestamp column: " + dataset_path);
    }

    std::array<double, 24> sum{};
    std::array<size_t, 24> count{};
    size_t rows = 0;

    std::vector<std::string> row;
    while (csv.read_row(row)) {
        double demand = 0.0;
        if (!utils::CsvReader::try_double(utils::CsvReader::cell(row, c_demand), demand) ||
            !std::isfinite(demand) || demand < 0.0) {
            throw dispatch::RetrainFailure("bad demand value at " + dataset_path + ":" +
                                           std::to_string(csv.line_number()));
        }

        int hour = -1;
        double hour_val = 0.0;
        if (c_hour >= 0 && utils::CsvReader::try_double(utils::CsvReader::cell(row, c_hour), hour_val)) {
            hour = static_cast<int>(hour_val);
        } else {
            int64_t ts = 0;
            if (c_ts >= 0 && utils::parse_timestamp(utils::CsvReader::cell(row, c_ts), ts)) {
                hour = utils::hour_of_day(ts);
            }
        }
        if (hour < 0 || hour > 23) {
            throw dispatch::RetrainFailure("bad hour at " + dataset_path + ":" +
                                           std::to_string(csv.line_number()));
        }

        sum[static_cast<size_t>(hour)] += demand;
        count[static_cast<size_t>(hour)] += 1;
        ++rows;
    }

    if (rows == 0) {
        throw dispatch::RetrainFailure("dataset has no rows: " + dataset_path);
    }

    HourlyProfile updated = profile_;
    size_t covered = 0;
    for (size_t h = 0; h < 24; ++h) {
        if (count[h] > 0) {
            updated[h] = sum[h] / static_cast<double>(count[h]);
            ++covered;
        }
    }

    auto fresh = std::make_shared<ProfileForecaster>(horizon_, lookback_, updated, true);
    fresh->generation_ = generation_ + 1;

    LOG_INFO("[Forecast] Profile retrained from %s: %zu rows, %zu/24 hours covered",
             dataset_path.c_str(), rows, covered);
    return fresh;
}

} // namespace forecast
