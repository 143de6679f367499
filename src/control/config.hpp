#pragma once
#include "limits.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Compile-time configuration of the press controller
 *
 * Pin assignments follow an ATmega328P board (Uno/Nano pinout):
 * the IR receiver output goes to a plain digital input, the servo signal
 * to a Timer1 compare output so the pulse has 4 us resolution.
 *
 * Angles and delays are tuned to the physical rig (button travel, servo
 * speed and torque). There is no runtime calibration.
 */
struct PressConfig {
  // Pins
  int ir_receiver_pin{2};           ///< D2, IR receiver OUT
  int servo_channel{9};             ///< D9 / OC1A, servo signal
  bool receiver_active_low{true};   ///< Receiver pulls LOW while it sees a carrier

  // Press motion
  int rest_angle{0};                                    ///< Horn clear of the button
  int press_angle{90};                                  ///< Horn holding the button down
  std::chrono::milliseconds engage_delay{500};          ///< Travel + hold time at press angle
  std::chrono::milliseconds release_delay{300};         ///< Return time before polling again

  // Loop timing
  double poll_hz{1000.0};           ///< Receiver poll rate
  double telemetry_idle_hz{1.0};    ///< Heartbeat rate while idle (0 disables)

  const char* telemetry_endpoint{"tcp://127.0.0.1:5556"};

  /**
   * @throws std::invalid_argument if poll_hz is not positive
   */
  std::chrono::nanoseconds poll_period() const {
    if (!(poll_hz > 0.0) || poll_hz > MAX_POLL_HZ) {
      throw std::invalid_argument("poll_hz must be in (0, 100000]");
    }
    return std::chrono::nanoseconds(static_cast<long long>(1e9 / poll_hz));
  }

  /**
   * @brief Check the configuration against the board and servo
   * @return One message per problem; empty when the configuration is usable
   */
  std::vector<std::string> validate(const ServoLimits& lim = ServoLimits{}) const {
    std::vector<std::string> problems;

    if (ir_receiver_pin < FIRST_INPUT_PIN || ir_receiver_pin > LAST_INPUT_PIN) {
      problems.push_back("ir_receiver_pin " + std::to_string(ir_receiver_pin) +
                         " is not a usable digital input (D2-D19)");
    }
    if (!is_servo_channel(servo_channel)) {
      problems.push_back("servo_channel " + std::to_string(servo_channel) +
                         " is not a Timer1 output (D9 or D10)");
    }
    if (ir_receiver_pin == servo_channel) {
      problems.push_back("ir_receiver_pin and servo_channel share pin " +
                         std::to_string(servo_channel));
    }
    if (!lim.contains(rest_angle)) {
      problems.push_back("rest_angle " + std::to_string(rest_angle) + " outside servo range");
    }
    if (!lim.contains(press_angle)) {
      problems.push_back("press_angle " + std::to_string(press_angle) + " outside servo range");
    }
    if (rest_angle == press_angle) {
      problems.push_back("rest_angle and press_angle are equal, the servo would never move");
    }
    if (engage_delay.count() <= 0) {
      problems.push_back("engage_delay must be positive");
    }
    if (release_delay.count() <= 0) {
      problems.push_back("release_delay must be positive");
    }
    if (!(poll_hz > 0.0) || poll_hz > MAX_POLL_HZ) {
      problems.push_back("poll_hz must be in (0, 100000]");
    }
    if (telemetry_idle_hz < 0.0) {
      problems.push_back("telemetry_idle_hz must not be negative");
    }
    if (telemetry_endpoint == nullptr || telemetry_endpoint[0] == '\0') {
      problems.push_back("telemetry_endpoint is empty");
    }

    return problems;
  }

  static constexpr int FIRST_INPUT_PIN = 2;     // D0/D1 carry the serial port
  static constexpr int LAST_INPUT_PIN = 19;     // A5 used as digital
  static constexpr double MAX_POLL_HZ = 100000.0;

  static bool is_servo_channel(int pin) {
    return pin == 9 || pin == 10;
  }
};
