#pragma once
#include "iservo.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>

/**
 * @brief Hobby servo on a Timer1 compare output
 *
 * Pulse generation follows a 16 MHz ATmega328P with Timer1 in fast PWM
 * mode, prescaler 64 (4 us per count) and a 20 ms frame (ICR1 = 4999).
 * The angle maps linearly onto the compare register:
 *   0 deg   -> 125 counts (0.5 ms)
 *   90 deg  -> 375 counts (1.5 ms)
 *   180 deg -> 625 counts (2.5 ms)
 *
 * The horn does not jump to the new angle. It travels at a fixed slew rate,
 * which is what the settle delays in the driver have to cover.
 */
class SimServo : public IServo {
public:
    using clock = std::chrono::steady_clock;

    // Timer1 configuration
    static constexpr uint32_t CPU_HZ = 16000000;
    static constexpr uint32_t PRESCALER = 64;
    static constexpr uint16_t FRAME_TOP = 4999;      ///< 20 ms frame at 4 us per count
    static constexpr uint16_t PULSE_MIN = 125;       ///< 0.5 ms
    static constexpr uint16_t PULSE_MID = 375;       ///< 1.5 ms
    static constexpr uint16_t PULSE_MAX = 625;       ///< 2.5 ms

private:
    int commanded_deg_{0};               ///< Last commanded angle
    uint16_t compare_counts_{PULSE_MIN}; ///< OCR1x value for the commanded angle

    // Horn motion
    double slew_dps_{300.0};             ///< Horn speed in degrees per second
    double move_from_deg_{0.0};          ///< Horn position when the last move started
    clock::time_point move_start_;

    uint64_t command_count_{0};

public:
    /**
     * @param channel PWM pin (9 = OC1A, 10 = OC1B)
     * @param id Identifier for logging
     * @param slew_dps Horn speed in degrees per second
     */
    explicit SimServo(int channel, const std::string& id = "SERVO", double slew_dps = 300.0)
        : slew_dps_(slew_dps > 0.0 ? slew_dps : 300.0)
        , move_start_(clock::now())
    {
        channel_ = channel;
        set_id(id);
    }

    /**
     * @brief Latch a new angle (implements IServo::set_angle)
     * @throws std::runtime_error if the channel is not initialized
     * @throws std::out_of_range if @p degrees is outside the limits
     */
    void set_angle(int degrees) override {
        if (!initialized_) {
            throw std::runtime_error("Servo not initialized");
        }
        if (degrees < min_deg_ || degrees > max_deg_) {
            throw std::out_of_range("Servo angle " + std::to_string(degrees) + " outside mechanical range");
        }

        auto now = clock::now();
        move_from_deg_ = horn_deg_at(now);
        move_start_ = now;
        commanded_deg_ = degrees;
        compare_counts_ = angle_to_counts(degrees);
        command_count_++;
    }

    int get_angle() const override {
        return commanded_deg_;
    }

    bool initialize() override {
        if (channel_ != 9 && channel_ != 10) {
            last_error_ = ErrorState::INVALID_CHANNEL;
            return false;
        }
        if (!IServo::initialize()) {
            return false;
        }
        command_count_ = 0;
        return true;
    }

    /**
     * @brief Physical horn angle at @p t
     */
    double horn_deg_at(clock::time_point t) const {
        double elapsed_s = std::chrono::duration<double>(t - move_start_).count();
        if (elapsed_s < 0.0) elapsed_s = 0.0;
        double travel = slew_dps_ * elapsed_s;
        double remaining = commanded_deg_ - move_from_deg_;
        if (std::abs(remaining) <= travel) {
            return static_cast<double>(commanded_deg_);
        }
        return move_from_deg_ + (remaining > 0.0 ? travel : -travel);
    }

    double horn_deg() const {
        return horn_deg_at(clock::now());
    }

    /**
     * @brief Whether the horn has reached the commanded angle
     * @param tolerance_deg Allowed deviation in degrees
     */
    bool is_settled(double tolerance_deg = 1.0) const {
        return std::abs(horn_deg() - commanded_deg_) <= tolerance_deg;
    }

    /**
     * @brief Travel time between two angles at this servo's slew rate
     */
    std::chrono::milliseconds travel_time(int from_deg, int to_deg) const {
        double s = std::abs(to_deg - from_deg) / slew_dps_;
        return std::chrono::milliseconds(static_cast<long long>(std::ceil(s * 1000.0)));
    }

    /**
     * @brief Compare register value for an angle (clamped to 0-180)
     */
    static uint16_t angle_to_counts(int degrees) {
        if (degrees < 0) degrees = 0;
        if (degrees > 180) degrees = 180;
        return static_cast<uint16_t>(PULSE_MIN + (degrees * (PULSE_MAX - PULSE_MIN) + 90) / 180);
    }

    /**
     * @brief Pulse width for a compare value in microseconds
     */
    static uint32_t counts_to_pulse_us(uint16_t counts) {
        return static_cast<uint32_t>(counts) * (1000000u / (CPU_HZ / PRESCALER));
    }

    uint16_t get_compare_counts() const { return compare_counts_; }
    uint32_t get_pulse_us() const { return counts_to_pulse_us(compare_counts_); }
    uint64_t get_command_count() const { return command_count_; }
    double get_slew_rate() const { return slew_dps_; }

    std::string get_type_name() const override { return "SimServo"; }

    /**
     * @brief Pulse table must hit the 0.5/1.5/2.5 ms calibration points
     */
    bool self_test() override {
        return initialized_ &&
               angle_to_counts(0) == PULSE_MIN &&
               angle_to_counts(90) == PULSE_MID &&
               angle_to_counts(180) == PULSE_MAX;
    }
};
