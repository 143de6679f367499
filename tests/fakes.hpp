#pragma once
#include "../src/core/clock.hpp"
#include "../src/hw/idigital_input.hpp"
#include "../src/hw/iservo.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Recording fakes for the three hardware boundaries
 *
 * Every receiver read, servo command and delay is appended to one shared
 * CallLog so tests can check the exact interleaving.
 */

struct Call {
    enum class Kind { POLL, SET_ANGLE, SLEEP };
    Kind kind;
    long long value;  ///< POLL: 1 if active; SET_ANGLE: degrees; SLEEP: milliseconds

    bool operator==(const Call& o) const { return kind == o.kind && value == o.value; }
    bool operator!=(const Call& o) const { return !(*this == o); }

    static Call poll(bool active) { return Call{Kind::POLL, active ? 1 : 0}; }
    static Call set_angle(int deg) { return Call{Kind::SET_ANGLE, deg}; }
    static Call sleep(long long ms) { return Call{Kind::SLEEP, ms}; }
};

using CallLog = std::vector<Call>;

// Servo that records commands and tracks whether it is holding the press angle
class FakeServo : public IServo {
private:
    CallLog& log_;
    int angle_;
    int press_angle_;

public:
    bool engaged{false};

    FakeServo(CallLog& log, int initial_angle, int press_angle)
        : log_(log), angle_(initial_angle), press_angle_(press_angle) {
        set_id("fake_servo");
    }

    void set_angle(int degrees) override {
        log_.push_back(Call::set_angle(degrees));
        angle_ = degrees;
        engaged = (degrees == press_angle_);
    }

    int get_angle() const override { return angle_; }

    std::string get_type_name() const override { return "FakeServo"; }
    bool self_test() override { return true; }
};

// Delay that records instead of sleeping
struct FakeDelay : IDelay {
    CallLog& log;
    explicit FakeDelay(CallLog& l) : log(l) {}

    void sleep(std::chrono::milliseconds duration) override {
        log.push_back(Call::sleep(duration.count()));
    }
};

// Receiver that replays a script of "signal present" values, then stays idle
class FakeReceiver : public IDigitalInput {
private:
    CallLog& log_;
    std::vector<bool> script_;
    std::size_t next_{0};
    bool active_low_;
    const FakeServo* servo_;

public:
    std::vector<int> angle_at_poll;      ///< Servo angle seen by every poll
    int polls_while_engaged{0};          ///< Polls that happened mid-press

    FakeReceiver(CallLog& log, std::vector<bool> script, bool active_low,
                 const FakeServo* servo = nullptr)
        : log_(log), script_(std::move(script)), active_low_(active_low), servo_(servo) {
        set_id("fake_receiver");
        pin_ = 2;
    }

    bool read_line() override {
        bool active = next_ < script_.size() ? script_[next_] : false;
        next_++;
        log_.push_back(Call::poll(active));
        if (servo_ != nullptr) {
            angle_at_poll.push_back(servo_->get_angle());
            if (servo_->engaged) polls_while_engaged++;
        }
        bool level = active_low_ ? !active : active;
        stats_.update(level);
        return level;
    }

    std::string get_type_name() const override { return "FakeReceiver"; }
    bool self_test() override { return true; }
};

/**
 * @brief Publisher stand-in for PressLoop::run
 */
struct MockPublisher {
    int message_count = 0;
    std::string last_message;
    bool accept = true;

    bool send(const std::string& msg) {
        message_count++;
        last_message = msg;
        return accept;
    }
};
