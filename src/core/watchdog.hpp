#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

/**
 * @brief Receiver poll budget watchdog
 *
 * An idle poll must finish within one poll period, otherwise the line is
 * sampled less often than configured and short IR marks can fall between
 * samples. Each idle poll is timed against the budget; overruns are
 * counted, and once CRITICAL_STREAK of them happen back to back the alarm
 * callback runs (again on every further overrun in the streak).
 *
 * Press cycles block for hundreds of milliseconds and are never timed.
 */
class Watchdog {
public:
    using clock = std::chrono::steady_clock;
    using Alarm = std::function<void(const Watchdog&)>;

    static constexpr uint32_t CRITICAL_STREAK = 5;

    explicit Watchdog(std::chrono::nanoseconds poll_budget)
        : budget_(poll_budget)
    {}

    /**
     * @brief Time one idle poll
     * @return true if the poll overran its budget
     */
    bool check(clock::time_point poll_start, clock::time_point poll_end) {
        auto took = std::chrono::duration_cast<std::chrono::nanoseconds>(poll_end - poll_start);
        uint64_t ns = took.count() > 0 ? static_cast<uint64_t>(took.count()) : 0;

        polls_.fetch_add(1, std::memory_order_relaxed);
        sum_ns_.fetch_add(ns, std::memory_order_relaxed);
        if (ns > max_ns_.load(std::memory_order_relaxed)) {
            max_ns_.store(ns, std::memory_order_relaxed);
        }

        bool over = took > budget_;
        tripped_.store(over, std::memory_order_relaxed);
        if (!over) {
            streak_.store(0, std::memory_order_relaxed);
            return false;
        }

        uint32_t streak = streak_.fetch_add(1, std::memory_order_relaxed) + 1;
        if (streak >= CRITICAL_STREAK && alarm_) {
            alarm_(*this);
        }
        return true;
    }

    void set_critical_callback(Alarm alarm) { alarm_ = std::move(alarm); }

    std::chrono::nanoseconds get_budget() const { return budget_; }

    bool is_tripped() const { return tripped_.load(std::memory_order_relaxed); }
    uint32_t get_consecutive_misses() const { return streak_.load(std::memory_order_relaxed); }
    uint64_t get_total_checks() const { return polls_.load(std::memory_order_relaxed); }

    double get_mean_execution_ns() const {
        uint64_t n = polls_.load(std::memory_order_relaxed);
        return n == 0 ? 0.0 : static_cast<double>(sum_ns_.load(std::memory_order_relaxed)) / n;
    }

    uint64_t get_max_execution_ns() const { return max_ns_.load(std::memory_order_relaxed); }

private:
    std::chrono::nanoseconds budget_;   ///< One poll period

    // Written by the loop thread only, read by main for statistics
    std::atomic<bool> tripped_{false};      ///< Last poll overran
    std::atomic<uint32_t> streak_{0};       ///< Overruns in a row
    std::atomic<uint64_t> polls_{0};
    std::atomic<uint64_t> sum_ns_{0};
    std::atomic<uint64_t> max_ns_{0};

    Alarm alarm_;
};
