#pragma once
#include "../core/clock.hpp"
#include "../hw/iservo.hpp"
#include "config.hpp"
#include <chrono>
#include <cstdint>

/**
 * @brief Actuator Driver for the button-press servo
 *
 * Owns the commanded angle. Every servo command is followed by a fixed
 * settle delay because the horn moves asynchronously and the button needs a
 * minimum hold time. Commands are fire-and-forget; a jammed linkage is not
 * detectable here.
 *
 * Invariant: outside press_cycle() the commanded angle is rest_angle.
 */
struct ActuatorDriver {
  IServo& servo;                            ///< Servo PWM channel
  IDelay& delay;                            ///< Blocking settle delay
  int rest_angle;                           ///< Angle with the button released
  int press_angle;                          ///< Angle with the button held down
  std::chrono::milliseconds engage_delay;   ///< Wait after moving to press_angle
  std::chrono::milliseconds release_delay;  ///< Wait after moving to rest_angle

  ActuatorDriver(IServo& s, IDelay& d, const PressConfig& cfg)
    : servo(s)
    , delay(d)
    , rest_angle(cfg.rest_angle)
    , press_angle(cfg.press_angle)
    , engage_delay(cfg.engage_delay)
    , release_delay(cfg.release_delay)
    , commanded_(cfg.rest_angle) {}

  /**
   * @brief Move to press_angle and hold for engage_delay
   */
  void engage() {
    command(press_angle);
    delay.sleep(engage_delay);
  }

  /**
   * @brief Move back to rest_angle and wait release_delay
   */
  void release() {
    command(rest_angle);
    delay.sleep(release_delay);
  }

  /**
   * @brief One full press: engage() then release(). Runs to completion.
   */
  void press_cycle() {
    engage();
    release();
    cycles_++;
  }

  /**
   * @brief Put the horn at rest_angle once at startup
   * @return false if the servo rejected the command
   */
  bool park() {
    IServo::SetResult r = servo.set_with_result(rest_angle);
    if (!r.success) return false;
    commanded_ = rest_angle;
    delay.sleep(release_delay);
    return true;
  }

  /**
   * @brief Last commanded angle (rest_angle before any command)
   */
  int angle() const { return commanded_; }

  bool at_rest() const { return commanded_ == rest_angle; }

  std::uint64_t cycle_count() const { return cycles_; }

private:
  void command(int deg) {
    servo.set_angle(deg);
    commanded_ = deg;
  }

  int commanded_;
  std::uint64_t cycles_{0};
};
