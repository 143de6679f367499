#pragma once
#include "../hw/idigital_input.hpp"
#include <cstdint>

/**
 * @brief Signal Monitor for the IR receiver line
 *
 * Turns the raw receiver level into "signal present". Any activity counts
 * as a button press: no debouncing, no edge detection, no decoding of the
 * pulse train.
 */
struct SignalMonitor {
  IDigitalInput& line;     ///< Receiver output line
  bool active_low{true};   ///< LOW means carrier detected

  SignalMonitor(IDigitalInput& input, bool is_active_low)
    : line(input), active_low(is_active_low) {}

  /**
   * @brief Sample the receiver once
   * @return true if the line is at its active level right now
   */
  bool poll() {
    bool level = line.read_line();
    bool active = active_low ? !level : level;
    polls_++;
    if (active) detections_++;
    return active;
  }

  std::uint64_t poll_count() const { return polls_; }
  std::uint64_t detect_count() const { return detections_; }

private:
  std::uint64_t polls_{0};
  std::uint64_t detections_{0};
};
