// src/engine/decision_record.hpp
#pragma once

#include "dispatch/dispatch_types.hpp"
#include "engine/load_advisor.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace engine {

// One logged decision. Built once by the engine, never modified afterwards.
struct DecisionRecord {
    int64_t timestamp_s = 0;              // timestamp of the conditions decided on
    double requested_power_kw = 0.0;
    dispatch::Allocation allocation;
    dispatch::DecisionMetrics metrics;
    dispatch::Weights weights;

    // Empty when the forecast was unavailable or timed out
    std::vector<double> forecast_kw;
    std::string forecast_provider;

    std::string reasoning;
    LoadSheddingPlan load_shedding;

    bool fallback = false;                // grid-only because conditions could not be scored
    std::string fallback_reason;

    bool has_forecast() const { return !forecast_kw.empty(); }
};

} // namespace engine
