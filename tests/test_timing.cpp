#include "../src/core/clock.hpp"
#include <chrono>
#include <vector>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <thread>

/**
 * @brief Test timing primitives: PeriodicClock, SteadyDelay, TickCounter
 *
 * This test verifies:
 * 1. Poll clock period consistency
 * 2. Period restart after a long blocking section
 * 3. SteadyDelay never returns early
 * 4. Tick arithmetic across the 32-bit wrap
 * 5. Tick/duration conversion
 */
int main() {
    using namespace std::chrono;

    std::cout << "Testing timing primitives..." << std::endl;

    // Test 1: 1 kHz poll clock accuracy
    {
        std::cout << "Test 1: 1kHz poll clock" << std::endl;

        PeriodicClock clk(microseconds(1000));
        auto start_time = steady_clock::now();

        const int num_iterations = 200;
        for (int i = 0; i < num_iterations; i++) {
            clk.wait_next();
        }

        auto actual_total = duration_cast<microseconds>(steady_clock::now() - start_time);
        auto expected_total = microseconds(num_iterations * 1000);

        std::cout << "  Expected total time: " << expected_total.count() << " us" << std::endl;
        std::cout << "  Actual total time: " << actual_total.count() << " us" << std::endl;

        // sleep_until never wakes early and the schedule does not drift
        assert(actual_total >= expected_total);
        assert(actual_total < expected_total + milliseconds(50));

        std::cout << "  1kHz poll clock test passed" << std::endl;
    }

    // Test 2: set_period restarts the schedule from now
    {
        std::cout << "Test 2: Schedule restart" << std::endl;

        PeriodicClock clk(milliseconds(2));
        assert(clk.get_period() == milliseconds(2));

        // Simulate a press cycle blocking for many periods
        std::this_thread::sleep_for(milliseconds(20));
        assert(clk.time_to_next() == nanoseconds::zero());

        clk.set_period(clk.get_period());
        assert(clk.time_to_next() > nanoseconds::zero());
        assert(clk.time_to_next() <= milliseconds(2));

        // Next wait is a full period again, not an immediate catch-up
        auto t0 = steady_clock::now();
        clk.wait_next();
        assert(steady_clock::now() - t0 >= microseconds(1500));

        clk.set_period(microseconds(500));
        assert(clk.get_period() == microseconds(500));

        std::cout << "  Schedule restart test passed" << std::endl;
    }

    // Test 3: SteadyDelay waits at least the requested time
    {
        std::cout << "Test 3: SteadyDelay" << std::endl;

        SteadyDelay delay;
        IDelay& d = delay;

        const std::vector<milliseconds> durations = {milliseconds(0), milliseconds(5), milliseconds(30)};
        for (auto ms : durations) {
            auto t0 = steady_clock::now();
            d.sleep(ms);
            auto took = steady_clock::now() - t0;
            assert(took >= ms);
            assert(took < ms + milliseconds(50));
        }

        std::cout << "  SteadyDelay test passed" << std::endl;
    }

    // Test 4: Tick arithmetic across the wrap
    {
        std::cout << "Test 4: Tick wrap" << std::endl;

        const uint32_t near_wrap = 0xFFFFFFF0u;
        const uint32_t after_wrap = 0x00000010u;

        assert(TickCounter::elapsed(near_wrap, after_wrap) == 0x20u);
        assert(TickCounter::elapsed(100, 150) == 50u);

        assert(TickCounter::reached(after_wrap, near_wrap));
        assert(!TickCounter::reached(near_wrap, after_wrap));
        assert(TickCounter::reached(500, 500));
        assert(!TickCounter::reached(499, 500));

        // Counter started just before the wrap keeps counting through it
        TickCounter ticks(0xFFFFFFFFu - 1000);
        uint32_t t0 = ticks.now();
        std::this_thread::sleep_for(milliseconds(100));
        uint32_t t1 = ticks.now();
        assert(t1 < t0);  // wrapped
        assert(TickCounter::elapsed(t0, t1) >= 2000);
        assert(TickCounter::reached(t1, t0));

        std::cout << "  Tick wrap test passed" << std::endl;
    }

    // Test 5: Tick/duration conversion
    {
        std::cout << "Test 5: Tick conversion" << std::endl;

        assert(TickCounter::FREQ_HZ * TickCounter::TICK.count() == 1000000);
        assert(TickCounter::to_duration(1) == microseconds(50));
        assert(TickCounter::to_duration(20000) == seconds(1));
        assert(TickCounter::from_duration(milliseconds(9)) == 180u);
        assert(TickCounter::from_duration(microseconds(49)) == 0u);
        assert(TickCounter::from_duration(TickCounter::to_duration(1234)) == 1234u);

        TickCounter ticks;
        std::this_thread::sleep_for(milliseconds(5));
        assert(ticks.now() >= 100u);

        std::cout << "  Tick conversion test passed" << std::endl;
    }

    std::cout << "\nAll timing tests passed!" << std::endl;
    return 0;
}
