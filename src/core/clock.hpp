#pragma once
#include <chrono>
#include <cstdint>
#include <thread>

/**
 * @brief Periodic clock for the receiver poll loop
 *
 * Uses std::this_thread::sleep_until so that the poll schedule does not
 * drift: the next wake time is always the previous one plus one period.
 */
struct PeriodicClock {
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds period;
    clock::time_point next;

    /**
     * @brief Construct a new Periodic Clock
     * @param p Period between clock ticks in nanoseconds
     */
    explicit PeriodicClock(std::chrono::nanoseconds p)
        : period(p), next(clock::now() + p) {}

    /**
     * @brief Wait until the next scheduled tick, then advance the schedule
     */
    void wait_next() {
        std::this_thread::sleep_until(next);
        next += period;
    }

    std::chrono::nanoseconds get_period() const {
        return period;
    }

    /**
     * @brief Update the period and restart the schedule from now
     *
     * Also used after a long blocking section so the clock does not try to
     * catch up on every tick it missed.
     */
    void set_period(std::chrono::nanoseconds new_period) {
        period = new_period;
        next = clock::now() + period;
    }

    /**
     * @brief Get time until next scheduled wake
     */
    std::chrono::nanoseconds time_to_next() const {
        auto now = clock::now();
        if (next <= now) {
            return std::chrono::nanoseconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(next - now);
    }
};

/**
 * @brief Blocking delay primitive
 *
 * The settle delays after each servo command go through this interface so
 * tests can record them instead of actually sleeping.
 */
struct IDelay {
    virtual ~IDelay() = default;
    virtual void sleep(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief IDelay backed by the steady clock
 *
 * Returns only after the full duration has elapsed, even if the thread
 * wakes early.
 */
struct SteadyDelay : IDelay {
    void sleep(std::chrono::milliseconds duration) override {
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_until(deadline);
        }
    }
};

/**
 * @brief Free-running 50 us tick counter
 *
 * Mirrors an 8-bit timer in CTC mode firing every 50 us (16 MHz / 8,
 * compare at 99) that increments a 32-bit counter. The counter wraps after
 * about 59.6 hours; compare ticks only through elapsed() so the wrap is
 * harmless.
 */
struct TickCounter {
    using clock = std::chrono::steady_clock;

    static constexpr std::chrono::microseconds TICK{50};  ///< Tick resolution
    static constexpr uint32_t FREQ_HZ = 20000;            ///< Ticks per second

    clock::time_point origin;
    uint32_t offset{0};  ///< Added to every reading (lets tests start near the wrap)

    TickCounter() : origin(clock::now()) {}
    explicit TickCounter(uint32_t start_ticks) : origin(clock::now()), offset(start_ticks) {}

    /**
     * @brief Current tick count
     */
    uint32_t now() const {
        auto ticks = (clock::now() - origin) / TICK;
        return static_cast<uint32_t>(ticks) + offset;
    }

    /**
     * @brief Ticks from @p from to @p to, correct across one wrap
     */
    static uint32_t elapsed(uint32_t from, uint32_t to) {
        return to - from;
    }

    /**
     * @brief True once @p now has reached @p deadline (wrap-safe)
     */
    static bool reached(uint32_t now, uint32_t deadline) {
        return static_cast<int32_t>(now - deadline) >= 0;
    }

    static std::chrono::microseconds to_duration(uint32_t ticks) {
        return std::chrono::microseconds(static_cast<int64_t>(ticks) * TICK.count());
    }

    static uint32_t from_duration(std::chrono::microseconds d) {
        return static_cast<uint32_t>(d.count() / TICK.count());
    }
};
