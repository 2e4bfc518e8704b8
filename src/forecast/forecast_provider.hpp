// src/forecast/forecast_provider.hpp
#pragma once

#include "dispatch/dispatch_types.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace forecast {

using ForecastWindow = std::vector<dispatch::ConditionRecord>;

/**
 * ForecastProvider - Demand forecaster seen from the dispatch core
 *
 * The core only consumes point predictions for display and logging; it
 * never feeds them into the allocation.
 *
 * Retraining is copy-on-write: retrain() builds and returns a NEW provider
 * and leaves `this` untouched, so the engine can swap handles atomically
 * while in-flight predictions keep using the old instance.
 */
class ForecastProvider {
public:
    virtual ~ForecastProvider() = default;

    virtual std::string name() const = 0;

    // Number of future steps predict() returns
    virtual size_t horizon() const = 0;

    // History length the model wants; shorter windows are accepted
    virtual size_t lookback() const = 0;

    virtual bool is_loaded() const = 0;

    /**
     * Predict demand (kW) for the `horizon()` steps after the last record
     * of `recent_window`.
     * @throws dispatch::ModelUnavailable if the model is not loaded or fails
     */
    virtual std::vector<double> predict(const ForecastWindow& recent_window) const = 0;

    /**
     * Build a retrained provider from a dataset.
     * @throws dispatch::RetrainFailure on any failure; `this` stays valid
     */
    virtual std::shared_ptr<ForecastProvider> retrain(const std::string& dataset_path) const = 0;
};

using ForecastProviderPtr = std::shared_ptr<ForecastProvider>;

} // namespace forecast
