// src/sim/timing_controller.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace sim {

/**
 * TimingController - Paces a live replay against the wall clock
 *
 * One replayed timestep (an hour of site data) maps to step_wall_s seconds
 * of wall time. Deadlines are absolute from reset(), so a slow step is
 * caught up on the following ones instead of accumulating drift.
 *
 * step_wall_s <= 0 disables pacing; wait_for_next_step() returns at once.
 */
class TimingController {
public:
    struct Stats {
        size_t total_steps = 0;
        size_t deadline_misses = 0;
        double max_lateness_ms = 0.0;
        double avg_lateness_ms = 0.0;
        double max_step_time_ms = 0.0;
    };

    explicit TimingController(double step_wall_s)
        : step_ns_(step_wall_s > 0.0 ? static_cast<int64_t>(step_wall_s * 1e9) : 0)
    {
        reset();
    }

    void reset() {
        step_count_ = 0;
        total_lateness_ms_ = 0.0;
        stats_ = Stats{};
        epoch_ = std::chrono::steady_clock::now();
        step_start_ = epoch_;
    }

    bool paced() const { return step_ns_ > 0; }

    /**
     * Mark start of a step's computation
     */
    void mark_step_start() {
        step_start_ = std::chrono::steady_clock::now();
    }

    /**
     * Wait until the next step deadline
     *
     * Returns false if the deadline was already missed (step too slow)
     */
    bool wait_for_next_step() {
        using namespace std::chrono;

        const auto now = steady_clock::now();
        const double step_ms = duration<double, std::milli>(now - step_start_).count();
        stats_.max_step_time_ms = std::max(stats_.max_step_time_ms, step_ms);
        stats_.total_steps++;
        step_count_++;

        if (!paced()) {
            return true;
        }

        const auto deadline = epoch_ + nanoseconds(static_cast<int64_t>(step_count_) * step_ns_);
        if (now > deadline) {
            const double lateness_ms = duration<double, std::milli>(now - deadline).count();
            stats_.deadline_misses++;
            stats_.max_lateness_ms = std::max(stats_.max_lateness_ms, lateness_ms);
            total_lateness_ms_ += lateness_ms;
            stats_.avg_lateness_ms = total_lateness_ms_ / static_cast<double>(stats_.deadline_misses);
            return false;
        }

        std::this_thread::sleep_until(deadline);
        return true;
    }

    /**
     * Wall-clock time since reset (seconds)
     */
    double get_wall_time() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_).count();
    }

    /**
     * Wall time minus scheduled time (positive = running slow)
     */
    double get_time_drift() const {
        return get_wall_time() - static_cast<double>(step_count_) * (static_cast<double>(step_ns_) / 1e9);
    }

    const Stats& get_stats() const { return stats_; }

private:
    int64_t step_ns_;

    size_t step_count_ = 0;
    double total_lateness_ms_ = 0.0;

    std::chrono::steady_clock::time_point epoch_;
    std::chrono::steady_clock::time_point step_start_;

    Stats stats_;
};

} // namespace sim
