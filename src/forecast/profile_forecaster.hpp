// src/forecast/profile_forecaster.hpp
#pragma once

#include "forecast/forecast_provider.hpp"
#include <array>

namespace forecast {

using HourlyProfile = std::array<double, 24>;

/**
 * ProfileForecaster - Hour-of-day demand profile scaled to recent load
 *
 * prediction[k] = profile[(h_last + 1 + k) % 24] * scale, where scale is
 * the ratio of observed to profiled demand over the recent window (1.0
 * when the window carries no usable demand).
 *
 * Retraining averages a dataset's demand per hour of day; hours absent
 * from the dataset keep their previous value.
 */
class ProfileForecaster : public ForecastProvider {
public:
    // Built-in residential profile (kW)
    static HourlyProfile default_profile();

    explicit ProfileForecaster(size_t horizon = 6,
                               size_t lookback = 24,
                               const HourlyProfile& profile = default_profile(),
                               bool loaded = true);

    /**
     * Build from a dataset CSV.
     * @throws dispatch::RetrainFailure if the dataset is unusable
     */
    static std::shared_ptr<ProfileForecaster> from_dataset(const std::string& dataset_path,
                                                           size_t horizon = 6,
                                                           size_t lookback = 24);

    std::string name() const override { return "profile"; }
    size_t horizon() const override { return horizon_; }
    size_t lookback() const override { return lookback_; }
    bool is_loaded() const override { return loaded_; }

    std::vector<double> predict(const ForecastWindow& recent_window) const override;

    std::shared_ptr<ForecastProvider> retrain(const std::string& dataset_path) const override;

    const HourlyProfile& profile() const { return profile_; }
    unsigned generation() const { return generation_; }

private:
    size_t horizon_;
    size_t lookback_;
    HourlyProfile profile_;
    bool loaded_;
    unsigned generation_ = 0;   // number of successful retrains behind this instance
};

} // namespace forecast
