#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Telemetry sample published by the press loop
 *
 * One sample after every press cycle and a low-rate heartbeat while idle.
 * Counters are cumulative since startup.
 */
struct TelemetrySample {
    // Timing information
    double t_sec;                 ///< Seconds since the loop started
    std::uint64_t cycle;          ///< Loop iterations so far

    // Loop state
    bool actuating;               ///< True while a press cycle is running
    int angle_deg;                ///< Last commanded servo angle

    // Counters
    std::uint64_t polls;          ///< Receiver polls
    std::uint64_t detections;     ///< Polls that saw the active level
    std::uint64_t presses;        ///< Completed press cycles

    // Health
    bool deadline_miss;           ///< Last idle poll overran its budget
    std::uint64_t deadline_misses; ///< Total idle poll overruns

    TelemetrySample()
        : t_sec(0.0)
        , cycle(0)
        , actuating(false)
        , angle_deg(0)
        , polls(0)
        , detections(0)
        , presses(0)
        , deadline_miss(false)
        , deadline_misses(0)
    {}

    /**
     * @brief Seconds elapsed since @p start_time
     */
    static double timestamp_from_steady_clock(
        const std::chrono::steady_clock::time_point& start_time) {
        auto duration = std::chrono::steady_clock::now() - start_time;
        return std::chrono::duration<double>(duration).count();
    }

    bool is_healthy() const {
        return !deadline_miss;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"t", t_sec},
            {"cycle", cycle},
            {"state", actuating ? "ACTUATING" : "IDLE"},
            {"angle", angle_deg},
            {"polls", polls},
            {"detections", detections},
            {"presses", presses},
            {"deadline_miss", deadline_miss ? 1 : 0},
            {"deadline_misses", deadline_misses}
        };
    }

    std::string to_string() const {
        char buffer[256];
        std::snprintf(buffer, sizeof(buffer),
            "TelemetrySample{t=%.3fs, cycle=%llu, state=%s, angle=%ddeg, "
            "polls=%llu, detections=%llu, presses=%llu, deadline:%s (%llu)}",
            t_sec, static_cast<unsigned long long>(cycle),
            actuating ? "ACTUATING" : "IDLE", angle_deg,
            static_cast<unsigned long long>(polls),
            static_cast<unsigned long long>(detections),
            static_cast<unsigned long long>(presses),
            deadline_miss ? "MISS" : "OK",
            static_cast<unsigned long long>(deadline_misses));
        return std::string(buffer);
    }
};
