#pragma once
#include "idigital_input.hpp"
#include "sim_noise.hpp"
#include "../core/clock.hpp"
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <vector>

/**
 * @brief Demodulating IR receiver simulation
 *
 * Models a TSOP-style 38 kHz receiver: the output idles HIGH and is pulled
 * LOW for every mark of a received frame. Each remote button press produces
 * one NEC-shaped frame:
 * - 9 ms leader mark, 4.5 ms space
 * - 32 bits (address, ~address, command, ~command), LSB first,
 *   each a 562 us mark followed by a 562 us (0) or 1687 us (1) space
 * - 562 us stop mark
 *
 * Presses are injected explicitly or generated as Poisson arrivals. Time is
 * taken from a 50 us TickCounter.
 */
class SimIrReceiver : public IDigitalInput {
public:
    // NEC frame timing (microseconds)
    static constexpr double LEADER_MARK_US = 9000.0;
    static constexpr double LEADER_SPACE_US = 4500.0;
    static constexpr double BIT_MARK_US = 562.0;
    static constexpr double ZERO_SPACE_US = 562.0;
    static constexpr double ONE_SPACE_US = 1687.0;

private:
    TickCounter ticks_;
    mutable IrSimNoise::RemoteTiming timing_;

    uint8_t address_{0x00};               ///< Address byte sent by the simulated remote
    uint8_t command_{0x45};               ///< Command byte (power button)

    // Current burst: cumulative edge offsets, marks at even indices
    std::vector<uint32_t> frame_edges_us_;
    uint32_t burst_start_tick_{0};
    bool burst_active_{false};

    // Random presses
    bool auto_press_{false};
    uint32_t next_press_tick_{0};

    uint64_t burst_count_{0};

public:
    /**
     * @param pin Digital pin the receiver output is wired to
     * @param id Identifier for logging
     * @param noise_seed Seed for press timing and edge jitter (0 = random)
     */
    explicit SimIrReceiver(int pin, const std::string& id = "IR_RX", uint64_t noise_seed = 0)
        : timing_(noise_seed)
    {
        pin_ = pin;
        set_id(id);
    }

    /**
     * @brief Current output level (implements IDigitalInput::read_line)
     * @return false (LOW) during a mark, true (HIGH) otherwise
     */
    bool read_line() override {
        if (!initialized_) {
            throw std::runtime_error("IR receiver not initialized");
        }

        uint32_t now = ticks_.now();
        if (auto_press_ && !burst_active_ && TickCounter::reached(now, next_press_tick_)) {
            // The frame started when the button was pressed, not when we looked.
            // If nobody read the line for the whole frame it is already over.
            start_burst(next_press_tick_);
            schedule_next_press(now);
        }

        bool level = !mark_at(now);
        stats_.update(level);
        return level;
    }

    bool initialize() override {
        if (pin_ < 2 || pin_ > 19) {
            last_error_ = ErrorState::INVALID_PIN;
            return false;
        }
        if (!IDigitalInput::initialize()) {
            return false;
        }
        burst_active_ = false;
        burst_count_ = 0;
        if (auto_press_) {
            schedule_next_press(ticks_.now());
        }
        return true;
    }

    /**
     * @brief Start a frame right now, as if a remote button was pressed
     */
    void inject_press() {
        start_burst(ticks_.now());
    }

    /**
     * @brief Generate presses automatically
     * @param mean_interval_s Mean seconds between presses (<= 0 disables)
     */
    void set_auto_press(double mean_interval_s) {
        auto_press_ = mean_interval_s > 0.0;
        if (auto_press_) {
            timing_.set_mean_press_interval(mean_interval_s);
            schedule_next_press(ticks_.now());
        }
    }

    void set_edge_jitter(double us) { timing_.set_edge_jitter(us); }

    /**
     * @brief Whether the frame has a mark at @p offset from its start
     */
    bool mark_at_offset(std::chrono::microseconds offset) const {
        if (!burst_active_ || offset.count() < 0) return false;
        uint32_t t = static_cast<uint32_t>(offset.count());
        for (std::size_t i = 0; i < frame_edges_us_.size(); ++i) {
            if (t < frame_edges_us_[i]) {
                return (i % 2) == 0;
            }
        }
        return false;
    }

    /**
     * @brief Length of the current frame (zero when idle)
     */
    std::chrono::microseconds frame_duration() const {
        if (frame_edges_us_.empty()) return std::chrono::microseconds::zero();
        return std::chrono::microseconds(frame_edges_us_.back());
    }

    bool is_receiving() const { return burst_active_; }
    uint64_t get_burst_count() const { return burst_count_; }

    std::string get_type_name() const override { return "SimIrReceiver"; }

    /**
     * @brief Line must idle HIGH when no frame is being received
     */
    bool self_test() override {
        if (!initialized_) return false;
        return burst_active_ || read_line();
    }

    /**
     * @brief Cumulative edge offsets for one frame, marks at even indices
     */
    static std::vector<uint32_t> build_frame(uint8_t address, uint8_t command,
                                             const IrSimNoise::RemoteTiming& timing) {
        std::vector<uint32_t> edges;
        double t = 0.0;
        auto push = [&](double nominal_us) {
            t += timing.jitter_us(nominal_us);
            edges.push_back(static_cast<uint32_t>(t));
        };

        push(LEADER_MARK_US);
        push(LEADER_SPACE_US);

        const uint8_t bytes[4] = {address, static_cast<uint8_t>(~address),
                                  command, static_cast<uint8_t>(~command)};
        for (uint8_t b : bytes) {
            for (int bit = 0; bit < 8; ++bit) {
                push(BIT_MARK_US);
                push(((b >> bit) & 1) ? ONE_SPACE_US : ZERO_SPACE_US);
            }
        }

        push(BIT_MARK_US);  // stop mark
        return edges;
    }

private:
    void start_burst(uint32_t now) {
        frame_edges_us_ = build_frame(address_, command_, timing_);
        burst_start_tick_ = now;
        burst_active_ = true;
        burst_count_++;
    }

    void schedule_next_press(uint32_t now) {
        double interval_s = timing_.next_press_interval_s();
        auto interval = std::chrono::microseconds(static_cast<int64_t>(interval_s * 1e6));
        next_press_tick_ = now + TickCounter::from_duration(interval);
    }

    bool mark_at(uint32_t now) {
        if (!burst_active_) return false;
        auto offset = TickCounter::to_duration(TickCounter::elapsed(burst_start_tick_, now));
        if (offset >= frame_duration()) {
            burst_active_ = false;
            return false;
        }
        return mark_at_offset(offset);
    }
};
