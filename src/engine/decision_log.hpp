// src/engine/decision_log.hpp
#pragma once

#include "engine/decision_record.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace engine {

/**
 * DecisionLog - Append-only history of engine decisions
 *
 * Records are never modified once appended. Readers (CSV export, range
 * queries) may run on another thread while the engine appends.
 */
class DecisionLog {
public:
    DecisionLog() = default;

    void append(DecisionRecord record);

    size_t size() const;
    bool empty() const { return size() == 0; }

    std::optional<DecisionRecord> latest() const;

    // Copy of every record, in append order
    std::vector<DecisionRecord> snapshot() const;

    // Records with from_s <= timestamp_s <= to_s, in append order
    std::vector<DecisionRecord> between(int64_t from_s, int64_t to_s) const;

    /**
     * Write the log as CSV (one row per decision).
     * @return false if the file cannot be opened
     */
    bool save_csv(const std::string& path) const;

    // Header and row layout used by save_csv
    static std::string csv_header();
    static std::string csv_row(const DecisionRecord& r);

private:
    mutable std::mutex mtx_;
    std::vector<DecisionRecord> records_;
};

} // namespace engine
