#pragma once
#include <chrono>
#include <cstdint>
#include <string>

/**
 * @brief Abstract digital input line
 *
 * Hardware abstraction for a single GPIO input pin, such as the output of
 * a demodulating IR receiver. The control layer only ever asks for the
 * current logic level; everything below that (port registers, pin change
 * capture, simulation) lives in the implementation.
 *
 * Features:
 * - Pure virtual level read for polymorphic access
 * - Initialization state and pin binding
 * - Read statistics for diagnostics
 */
class IDigitalInput {
public:
    /**
     * @brief Input line error states
     */
    enum class ErrorState {
        OK = 0,                    ///< Normal operation
        INVALID_PIN,               ///< Pin cannot be used as an input
        NOT_INITIALIZED,           ///< Line not configured yet
        HARDWARE_FAULT,            ///< Implementation reported a fault
        UNKNOWN_ERROR              ///< Unspecified error condition
    };

    /**
     * @brief Line read statistics
     */
    struct Statistics {
        uint64_t total_reads{0};       ///< Total number of level reads
        uint64_t high_reads{0};        ///< Reads that returned HIGH
        uint64_t low_reads{0};         ///< Reads that returned LOW
        std::chrono::steady_clock::time_point last_read_time; ///< Timestamp of last read

        void update(bool level) {
            total_reads++;
            if (level) {
                high_reads++;
            } else {
                low_reads++;
            }
            last_read_time = std::chrono::steady_clock::now();
        }
    };

protected:
    mutable Statistics stats_;                  ///< Read statistics
    ErrorState last_error_{ErrorState::OK};    ///< Last error encountered
    std::string input_id_;                      ///< Unique line identifier
    int pin_{-1};                               ///< Bound pin number
    bool initialized_{false};                  ///< Initialization state

public:
    /**
     * @brief Virtual destructor for proper cleanup
     */
    virtual ~IDigitalInput() = default;

    /**
     * @brief Read the current logic level (pure virtual)
     * @return true for HIGH, false for LOW
     *
     * Must not block and must not change hardware state.
     */
    virtual bool read_line() = 0;

    /**
     * @brief Configure the pin as an input
     * @return true if initialization successful
     */
    virtual bool initialize() {
        initialized_ = true;
        last_error_ = ErrorState::OK;
        return true;
    }

    /**
     * @brief Release the pin
     */
    virtual void shutdown() {
        initialized_ = false;
    }

    virtual bool is_initialized() const {
        return initialized_;
    }

    /**
     * @brief Pin this line is bound to
     */
    int get_pin() const {
        return pin_;
    }

    virtual std::string get_id() const {
        return input_id_;
    }

    virtual void set_id(const std::string& id) {
        input_id_ = id;
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
     * @brief Get input type name (for debugging/logging)
     */
    virtual std::string get_type_name() const = 0;

    /**
     * @brief Perform input self-test
     * @return true if self-test passes
     */
    virtual bool self_test() = 0;

    /**
     * @brief Convert error state to human-readable string
     */
    static std::string error_to_string(ErrorState error) {
        switch (error) {
            case ErrorState::OK: return "OK";
            case ErrorState::INVALID_PIN: return "INVALID_PIN";
            case ErrorState::NOT_INITIALIZED: return "NOT_INITIALIZED";
            case ErrorState::HARDWARE_FAULT: return "HARDWARE_FAULT";
            case ErrorState::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
            default: return "INVALID_ERROR_STATE";
        }
    }
};
