// utils/influx.hpp
#pragma once

#include "engine/decision_record.hpp"
#include "sim/simulation_driver.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB Client for time-series export of dispatch decisions
 *
 * Mirrors the decision log and simulation summaries into InfluxDB for
 * dashboards. Only enabled when the --influx flag is set.
 *
 * Organization: Vesta
 * Bucket: vesta-dispatch
 *
 * Measurement schema:
 *   - dispatch_decision: one point per decision (allocation, cost, carbon,
 *                        battery, first forecast step, deferred load)
 *   - simulation_summary: one point per finished simulation run, tagged
 *                        with the run name and weights
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "Vesta";                   // Organization name
        std::string bucket = "vesta-dispatch";       // Bucket name
        std::string site_tag = "site";               // value of the `site` tag on every point
        double write_interval_s = 0.0;               // minimum data-time spacing between decision points
        bool use_wall_clock = false;                 // stamp points with now() instead of data time
        bool enabled = false;                        // Only enabled with --influx flag
    };

    /**
     * Initialize InfluxDB client
     *
     * @param config InfluxDB configuration
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxClient(const Config& config);

    /**
     * Destructor - flushes any pending writes
     */
    ~InfluxClient();

    InfluxClient(const InfluxClient&) = delete;
    InfluxClient& operator=(const InfluxClient&) = delete;

    /**
     * Write one decision record
     *
     * Only writes if the client is enabled and at least write_interval_s of
     * data time has passed since the previous decision point.
     *
     * @return true if data was written, false if skipped or failed
     */
    bool write_decision(const engine::DecisionRecord& record);

    /**
     * Write the totals of a finished simulation run
     *
     * @param run_name Tag distinguishing runs in a sweep
     * @return true if data was written
     */
    bool write_simulation_summary(const sim::SimulationResult& result,
                                  const std::string& run_name);

    /**
     * Flush any buffered writes immediately
     */
    void flush();

    /**
     * Check if client is enabled
     */
    bool is_enabled() const { return config_.enabled; }

    /**
     * Number of successful HTTP writes so far
     */
    size_t writes_ok() const { return writes_ok_; }

    /**
     * Get current configuration
     */
    const Config& get_config() const { return config_; }

    // ========================================================================
    // Line protocol builders (public for tests; no I/O)
    // ========================================================================

    /**
     * Measurement: dispatch_decision
     * Tags: site, fallback
     * Fields: requested/solar/battery/grid kW, cost, carbon, battery charge,
     *         scores, forecast_next_kw (if any), deferred_kw
     */
    static std::string build_decision_line(const engine::DecisionRecord& record,
                                           const std::string& site_tag,
                                           int64_t timestamp_ns);

    /**
     * Measurement: simulation_summary
     * Tags: site, run
     * Fields: totals, baselines, savings, steps, gaps
     */
    static std::string build_summary_line(const sim::SimulationResult& result,
                                          const std::string& site_tag,
                                          const std::string& run_name,
                                          int64_t timestamp_ns);

    // Escape commas, spaces and equals signs in tag values
    static std::string escape_tag(const std::string& value);

    static int64_t seconds_to_ns(int64_t unix_s) { return unix_s * 1000000000LL; }

private:
    Config config_;
    int64_t last_decision_ts_s_;
    bool have_last_decision_ = false;
    size_t writes_ok_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    /**
     * Send line protocol data to InfluxDB
     *
     * @param line_protocol Concatenated line protocol strings
     * @return true if write succeeded, false otherwise
     */
    bool send_to_influx(const std::string& line_protocol);

    static int64_t wall_clock_time_ns();
};

} // namespace utils
