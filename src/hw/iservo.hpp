#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Abstract servo (PWM angle) interface
 *
 * Hardware abstraction for one PWM channel driving a hobby servo. Angle
 * commands are fire-and-forget: the servo moves asynchronously and there
 * is no position feedback, so callers wait a fixed settle delay instead.
 *
 * Features:
 * - Pure virtual angle command for polymorphic access
 * - Mechanical range checking through set_with_result()
 * - Error state management and command statistics
 */
class IServo {
public:
    /**
     * @brief Servo error states
     */
    enum class ErrorState {
        OK = 0,                    ///< Normal operation
        OUT_OF_RANGE,             ///< Commanded angle outside mechanical range
        INVALID_CHANNEL,          ///< Channel cannot generate servo pulses
        HARDWARE_FAULT,           ///< Implementation reported a fault
        NOT_INITIALIZED,          ///< Channel not configured yet
        UNKNOWN_ERROR             ///< Unspecified error condition
    };

    /**
     * @brief Angle command result
     */
    struct SetResult {
        bool success{false};                           ///< Operation success flag
        int commanded_deg{0};                          ///< Angle that was commanded
        ErrorState error{ErrorState::OK};             ///< Error state if any
        std::chrono::steady_clock::time_point timestamp; ///< When operation completed

        SetResult() : timestamp(std::chrono::steady_clock::now()) {}

        SetResult(bool succ, int commanded, ErrorState err = ErrorState::OK)
            : success(succ), commanded_deg(commanded)
            , error(err), timestamp(std::chrono::steady_clock::now()) {}
    };

    /**
     * @brief Command statistics
     */
    struct Statistics {
        uint64_t total_commands{0};              ///< Total number of commands sent
        uint64_t successful_commands{0};         ///< Number of successful commands
        uint64_t error_count{0};                 ///< Total number of errors
        uint64_t range_violations{0};            ///< Commands outside mechanical range
        std::chrono::steady_clock::time_point last_command_time; ///< Last command timestamp

        void update_on_success() {
            total_commands++;
            successful_commands++;
            last_command_time = std::chrono::steady_clock::now();
        }

        void update_on_error(ErrorState error_type) {
            total_commands++;
            error_count++;
            if (error_type == ErrorState::OUT_OF_RANGE) {
                range_violations++;
            }
            last_command_time = std::chrono::steady_clock::now();
        }
    };

protected:
    Statistics stats_;                          ///< Command statistics
    ErrorState last_error_{ErrorState::OK};    ///< Last error encountered
    std::string servo_id_;                      ///< Unique servo identifier
    int channel_{-1};                           ///< Bound PWM channel (pin)
    bool initialized_{false};                  ///< Initialization state

    // Mechanical range
    int min_deg_{0};                            ///< Minimum reachable angle
    int max_deg_{180};                          ///< Maximum reachable angle

public:
    virtual ~IServo() = default;

    /**
     * @brief Command the servo to an angle (pure virtual)
     * @param degrees Target angle in degrees
     *
     * Returns as soon as the command is latched; the horn keeps moving
     * afterwards.
     */
    virtual void set_angle(int degrees) = 0;

    /**
     * @brief Last commanded angle (pure virtual)
     */
    virtual int get_angle() const = 0;

    /**
     * @brief Command an angle with range checking and result reporting
     * @param degrees Target angle in degrees
     * @return SetResult with success status
     */
    virtual SetResult set_with_result(int degrees) {
        if (!initialized_) {
            last_error_ = ErrorState::NOT_INITIALIZED;
            stats_.update_on_error(last_error_);
            return SetResult(false, degrees, last_error_);
        }

        if (degrees < min_deg_ || degrees > max_deg_) {
            last_error_ = ErrorState::OUT_OF_RANGE;
            stats_.update_on_error(last_error_);
            return SetResult(false, degrees, last_error_);
        }

        try {
            set_angle(degrees);
        } catch (const std::exception&) {
            last_error_ = ErrorState::HARDWARE_FAULT;
            stats_.update_on_error(last_error_);
            return SetResult(false, degrees, last_error_);
        }

        last_error_ = ErrorState::OK;
        stats_.update_on_success();
        return SetResult(true, degrees, ErrorState::OK);
    }

    /**
     * @brief Configure the PWM channel
     * @return true if initialization successful
     */
    virtual bool initialize() {
        initialized_ = true;
        last_error_ = ErrorState::OK;
        return true;
    }

    /**
     * @brief Stop generating pulses
     */
    virtual void shutdown() {
        initialized_ = false;
    }

    virtual bool is_initialized() const {
        return initialized_;
    }

    /**
     * @brief PWM channel this servo is bound to
     */
    int get_channel() const {
        return channel_;
    }

    /**
     * @brief Set mechanical range
     * @param min_deg Minimum angle
     * @param max_deg Maximum angle
     */
    virtual void set_limits(int min_deg, int max_deg) {
        min_deg_ = min_deg;
        max_deg_ = max_deg;
    }

    virtual std::pair<int, int> get_limits() const {
        return {min_deg_, max_deg_};
    }

    virtual std::string get_id() const {
        return servo_id_;
    }

    virtual void set_id(const std::string& id) {
        servo_id_ = id;
    }

    ErrorState get_last_error() const {
        return last_error_;
    }

    const Statistics& get_statistics() const {
        return stats_;
    }

    virtual void reset_statistics() {
        stats_ = Statistics{};
    }

    /**
     * @brief Get servo type name (for debugging/logging)
     */
    virtual std::string get_type_name() const = 0;

    /**
     * @brief Perform servo self-test
     * @return true if self-test passes
     */
    virtual bool self_test() = 0;

    /**
     * @brief Convert error state to human-readable string
     */
    static std::string error_to_string(ErrorState error) {
        switch (error) {
            case ErrorState::OK: return "OK";
            case ErrorState::OUT_OF_RANGE: return "OUT_OF_RANGE";
            case ErrorState::INVALID_CHANNEL: return "INVALID_CHANNEL";
            case ErrorState::HARDWARE_FAULT: return "HARDWARE_FAULT";
            case ErrorState::NOT_INITIALIZED: return "NOT_INITIALIZED";
            case ErrorState::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
            default: return "INVALID_ERROR_STATE";
        }
    }
};
