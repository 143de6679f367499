#pragma once
#include "../core/clock.hpp"
#include "../core/telemetry.hpp"
#include "../core/watchdog.hpp"
#include "actuator_driver.hpp"
#include "config.hpp"
#include "signal_monitor.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>

/**
 * @brief Press loop states
 */
enum class LoopState {
  IDLE,       ///< Polling the receiver
  ACTUATING   ///< Running a press cycle, receiver not polled
};

inline const char* to_string(LoopState s) {
  return s == LoopState::IDLE ? "IDLE" : "ACTUATING";
}

/**
 * @brief Main control loop
 *
 * IDLE polls the Signal Monitor once per tick. A detection moves the loop
 * to ACTUATING for one blocking press cycle, then back to IDLE. The
 * receiver is never polled while ACTUATING, so IR activity during a cycle
 * is dropped, not queued.
 *
 * Idle ticks are checked against a one-period budget by the watchdog.
 */
struct PressLoop {
  SignalMonitor& monitor;      ///< Receiver side
  ActuatorDriver& driver;      ///< Servo side
  std::atomic<bool> running{true};  ///< Cleared by stop()
  double hz{1000.0};           ///< Poll rate
  double telemetry_idle_hz{1.0};    ///< Idle heartbeat rate

  std::atomic<LoopState> state{LoopState::IDLE};
  std::atomic<uint64_t> loop_count{0};       ///< Loop iteration counter
  std::atomic<uint64_t> press_count{0};      ///< Completed press cycles
  std::atomic<uint64_t> deadline_misses{0};  ///< Idle ticks over budget
  std::atomic<uint64_t> telemetry_drops{0};  ///< Samples the publisher refused

  Watchdog wd;

  /**
   * @brief Loop statistics snapshot
   */
  struct Stats {
    uint64_t loop_count;
    uint64_t press_count;
    uint64_t deadline_misses;
    uint64_t telemetry_drops;
    uint64_t timed_polls;     ///< Idle polls checked against the budget
    double mean_poll_time_us;
    double max_poll_time_us;
  };

  /**
   * @param m Signal Monitor
   * @param d Actuator Driver
   * @param cfg Poll and telemetry rates
   * @throws std::invalid_argument if cfg.poll_hz is not positive
   */
  PressLoop(SignalMonitor& m, ActuatorDriver& d, const PressConfig& cfg)
    : monitor(m), driver(d), hz(cfg.poll_hz), telemetry_idle_hz(cfg.telemetry_idle_hz)
    , wd(cfg.poll_period()) {
    wd.set_critical_callback([](const Watchdog& w) {
      std::cout << "WATCHDOG: " << w.get_consecutive_misses()
                << " consecutive receiver polls over budget" << std::endl;
    });
  }

  /**
   * @brief One loop iteration
   * @return true if a press cycle ran
   */
  bool tick() {
    auto start = std::chrono::steady_clock::now();
    bool detected = monitor.poll();

    if (!detected) {
      auto end = std::chrono::steady_clock::now();
      if (wd.check(start, end)) {
        deadline_misses.fetch_add(1);
      }
      loop_count.fetch_add(1);
      return false;
    }

    state.store(LoopState::ACTUATING);
    driver.press_cycle();
    press_count.fetch_add(1);
    state.store(LoopState::IDLE);
    loop_count.fetch_add(1);
    return true;
  }

  /**
   * @brief Run until stop() is called
   * @param pub Telemetry publisher, anything with bool send(const std::string&)
   *
   * A stop request is only seen between ticks; a running press cycle
   * always completes.
   */
  template<class Pub>
  void run(Pub& pub) {
    PeriodicClock clk(period());
    auto t0 = std::chrono::steady_clock::now();
    uint64_t heartbeat_every = heartbeat_ticks();
    uint64_t idle_ticks = 0;

    while (running.load(std::memory_order_relaxed)) {
      if (tick()) {
        publish(pub, t0);
        idle_ticks = 0;
        // The cycle blocked for many periods; restart the schedule instead of catching up.
        clk.set_period(clk.get_period());
        continue;
      }

      if (heartbeat_every > 0 && ++idle_ticks >= heartbeat_every) {
        publish(pub, t0);
        idle_ticks = 0;
      }

      clk.wait_next();
    }
  }

  void stop() { running.store(false); }

  /**
   * @brief Current telemetry sample
   * @param t0 Loop start time
   */
  TelemetrySample sample(std::chrono::steady_clock::time_point t0) const {
    TelemetrySample s;
    s.t_sec = TelemetrySample::timestamp_from_steady_clock(t0);
    s.cycle = loop_count.load();
    s.actuating = state.load() == LoopState::ACTUATING;
    s.angle_deg = driver.angle();
    s.polls = monitor.poll_count();
    s.detections = monitor.detect_count();
    s.presses = press_count.load();
    s.deadline_miss = wd.is_tripped();
    s.deadline_misses = deadline_misses.load();
    return s;
  }

  Stats get_stats() const {
    return Stats{
      loop_count.load(),
      press_count.load(),
      deadline_misses.load(),
      telemetry_drops.load(),
      wd.get_total_checks(),
      wd.get_mean_execution_ns() / 1000.0,
      static_cast<double>(wd.get_max_execution_ns()) / 1000.0
    };
  }

  std::chrono::nanoseconds period() const {
    return wd.get_budget();
  }

private:
  uint64_t heartbeat_ticks() const {
    if (telemetry_idle_hz <= 0.0) return 0;
    double ticks = hz / telemetry_idle_hz;
    return ticks < 1.0 ? 1 : static_cast<uint64_t>(ticks);
  }

  template<class Pub>
  void publish(Pub& pub, std::chrono::steady_clock::time_point t0) {
    if (!pub.send(sample(t0).to_json().dump())) {
      telemetry_drops.fetch_add(1);
    }
  }
};
