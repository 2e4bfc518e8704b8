// src/dispatch/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace dispatch {

// Negative or NaN power request. Rejected, never silently zeroed.
class InvalidDemand : public std::runtime_error {
public:
    explicit InvalidDemand(const std::string& what) : std::runtime_error(what) {}
};

// decide() called before the engine reached Ready.
class EngineNotReady : public std::runtime_error {
public:
    explicit EngineNotReady(const std::string& what) : std::runtime_error(what) {}
};

// Forecaster not loaded, or conditions too incomplete to score.
class ModelUnavailable : public std::runtime_error {
public:
    explicit ModelUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Provider retraining failed or timed out; the previous provider stays active.
class RetrainFailure : public std::runtime_error {
public:
    explicit RetrainFailure(const std::string& what) : std::runtime_error(what) {}
};

} // namespace dispatch
