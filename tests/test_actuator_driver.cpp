#include "../src/control/actuator_driver.hpp"
#include "fakes.hpp"
#include <cassert>
#include <iostream>
#include <chrono>

/**
 * @brief Test ActuatorDriver command and delay ordering
 */
int main() {
    std::cout << "Testing ActuatorDriver functionality..." << std::endl;

    PressConfig cfg;
    cfg.rest_angle = 15;
    cfg.press_angle = 75;
    cfg.engage_delay = std::chrono::milliseconds(450);
    cfg.release_delay = std::chrono::milliseconds(250);

    // Test 1: Initial state counts as rest
    {
        std::cout << "Test 1: Initial state" << std::endl;

        CallLog log;
        FakeServo servo(log, cfg.rest_angle, cfg.press_angle);
        FakeDelay delay(log);
        ActuatorDriver driver(servo, delay, cfg);

        assert(driver.angle() == 15);
        assert(driver.at_rest());
        assert(driver.cycle_count() == 0);
        assert(log.empty());

        std::cout << "  Initial state test passed" << std::endl;
    }

    // Test 2: engage() and release() each command then wait
    {
        std::cout << "Test 2: engage() and release()" << std::endl;

        CallLog log;
        FakeServo servo(log, cfg.rest_angle, cfg.press_angle);
        FakeDelay delay(log);
        ActuatorDriver driver(servo, delay, cfg);

        driver.engage();
        assert((log == CallLog{Call::set_angle(75), Call::sleep(450)}));
        assert(driver.angle() == 75);
        assert(!driver.at_rest());

        driver.release();
        assert((log == CallLog{Call::set_angle(75), Call::sleep(450),
                               Call::set_angle(15), Call::sleep(250)}));
        assert(driver.angle() == 15);
        assert(driver.at_rest());

        // Separate engage/release calls are not a press cycle
        assert(driver.cycle_count() == 0);

        std::cout << "  engage() and release() test passed" << std::endl;
    }

    // Test 3: press_cycle() is engage followed by release
    {
        std::cout << "Test 3: press_cycle()" << std::endl;

        CallLog log;
        FakeServo servo(log, cfg.rest_angle, cfg.press_angle);
        FakeDelay delay(log);
        ActuatorDriver driver(servo, delay, cfg);

        for (int i = 0; i < 3; ++i) {
            driver.press_cycle();
        }

        assert(log.size() == 12);
        for (std::size_t i = 0; i < log.size(); i += 4) {
            assert(log[i] == Call::set_angle(75));
            assert(log[i + 1] == Call::sleep(450));
            assert(log[i + 2] == Call::set_angle(15));
            assert(log[i + 3] == Call::sleep(250));
        }
        assert(driver.cycle_count() == 3);
        assert(driver.at_rest());
        assert(servo.get_angle() == 15);

        std::cout << "  press_cycle() test passed" << std::endl;
    }

    // Test 4: park() goes through the range-checked path
    {
        std::cout << "Test 4: park()" << std::endl;

        CallLog log;
        FakeServo servo(log, 60, cfg.press_angle);
        FakeDelay delay(log);
        ActuatorDriver driver(servo, delay, cfg);

        // Not initialized: rejected before reaching the servo
        assert(!driver.park());
        assert(servo.get_last_error() == IServo::ErrorState::NOT_INITIALIZED);
        assert(log.empty());

        assert(servo.initialize());
        assert(driver.park());
        assert((log == CallLog{Call::set_angle(15), Call::sleep(250)}));
        assert(servo.get_angle() == 15);
        assert(driver.at_rest());
        assert(driver.cycle_count() == 0);

        std::cout << "  park() test passed" << std::endl;
    }

    // Test 5: park() with a rest angle outside the servo range
    {
        std::cout << "Test 5: park() out of range" << std::endl;

        PressConfig bad = cfg;
        bad.rest_angle = 200;

        CallLog log;
        FakeServo servo(log, 0, bad.press_angle);
        FakeDelay delay(log);
        assert(servo.initialize());
        ActuatorDriver driver(servo, delay, bad);

        assert(!driver.park());
        assert(servo.get_last_error() == IServo::ErrorState::OUT_OF_RANGE);
        assert(servo.get_statistics().range_violations == 1);
        assert(log.empty());

        std::cout << "  park() out of range test passed" << std::endl;
    }

    std::cout << "\nAll ActuatorDriver tests passed!" << std::endl;
    return 0;
}
