#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <iomanip>

#include "hw/sim_ir_receiver.hpp"
#include "hw/sim_servo.hpp"
#include "control/config.hpp"
#include "control/signal_monitor.hpp"
#include "control/actuator_driver.hpp"
#include "control/loop.hpp"
#include "ipc/telemetry_pub.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested.store(true);
}

// Host simulation: mean seconds between simulated remote presses
constexpr double SIM_MEAN_PRESS_INTERVAL_S = 15.0;

int main() {
    std::cout << "IR Press Controller - Starting up..." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        const PressConfig cfg{};
        const ServoLimits lim{};

        auto problems = cfg.validate(lim);
        if (!problems.empty()) {
            std::cerr << "Invalid configuration:" << std::endl;
            for (const auto& p : problems) {
                std::cerr << "  " << p << std::endl;
            }
            return 1;
        }

        // Initialize hardware
        std::cout << "Initializing hardware..." << std::endl;

        SimIrReceiver receiver(cfg.ir_receiver_pin, "IR_RX");
        SimServo servo(cfg.servo_channel, "PRESS_SERVO");
        servo.set_limits(lim.min_deg, lim.max_deg);

        if (!receiver.initialize()) {
            std::cerr << "Failed to initialize IR receiver on pin " << cfg.ir_receiver_pin << ": "
                      << IDigitalInput::error_to_string(receiver.get_last_error()) << std::endl;
            return 1;
        }

        if (!servo.initialize()) {
            std::cerr << "Failed to initialize servo on channel " << cfg.servo_channel << ": "
                      << IServo::error_to_string(servo.get_last_error()) << std::endl;
            return 1;
        }

        if (!receiver.self_test() || !servo.self_test()) {
            std::cerr << "Hardware self test failed" << std::endl;
            return 1;
        }

        receiver.set_auto_press(SIM_MEAN_PRESS_INTERVAL_S);

        SteadyDelay delay;
        SignalMonitor monitor(receiver, cfg.receiver_active_low);
        ActuatorDriver driver(servo, delay, cfg);

        if (!driver.park()) {
            std::cerr << "Failed to park servo at " << cfg.rest_angle << " deg: "
                      << IServo::error_to_string(servo.get_last_error()) << std::endl;
            return 1;
        }

        std::cout << "Servo parked at " << driver.angle() << " deg ("
                  << servo.get_pulse_us() << " us pulse)" << std::endl;

        if (servo.travel_time(cfg.rest_angle, cfg.press_angle) > cfg.engage_delay) {
            std::cout << "Warning: engage delay " << cfg.engage_delay.count()
                      << " ms is shorter than servo travel time "
                      << servo.travel_time(cfg.rest_angle, cfg.press_angle).count() << " ms" << std::endl;
        }

        TelemetryPub telemetry_pub(cfg.telemetry_endpoint);
        if (!telemetry_pub.is_connected()) {
            std::cerr << "Failed to bind telemetry publisher to " << cfg.telemetry_endpoint << std::endl;
            return 1;
        }

        PressLoop control_loop(monitor, driver, cfg);

        std::cout << "System ready! Polling IR receiver at " << cfg.poll_hz << " Hz" << std::endl;
        std::cout << "  Press: " << cfg.rest_angle << " -> " << cfg.press_angle << " deg, hold "
                  << cfg.engage_delay.count() << " ms, release " << cfg.release_delay.count() << " ms" << std::endl;
        std::cout << "  Telemetry: " << telemetry_pub.get_bind_address() << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        std::thread loop_thread([&]() {
            try {
                control_loop.run(telemetry_pub);
            } catch (const std::exception& e) {
                std::cerr << "Control loop error: " << e.what() << std::endl;
                shutdown_requested.store(true);
            }
        });

        auto last_stats_time = std::chrono::steady_clock::now();
        uint64_t last_press_count = 0;
        while (!shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            uint64_t presses = control_loop.press_count.load();
            if (presses != last_press_count) {
                std::cout << "Press cycle " << presses << " complete" << std::endl;
                last_press_count = presses;
            }

            auto now = std::chrono::steady_clock::now();
            if (std::chrono::duration_cast<std::chrono::seconds>(now - last_stats_time).count() >= 10) {
                auto stats = control_loop.get_stats();
                std::cout << "Loop stats: " << stats.loop_count << " cycles, "
                          << stats.press_count << " presses, "
                          << stats.deadline_misses << " misses, "
                          << std::fixed << std::setprecision(3)
                          << stats.mean_poll_time_us << " us avg poll, "
                          << stats.max_poll_time_us << " us max" << std::endl;
                last_stats_time = now;
            }
        }

        std::cout << "\nShutdown requested, stopping control loop..." << std::endl;
        control_loop.stop();

        if (loop_thread.joinable()) {
            loop_thread.join();
        }

        auto final_stats = control_loop.get_stats();
        std::cout << "Final statistics:" << std::endl;
        std::cout << "  Total cycles: " << final_stats.loop_count << std::endl;
        std::cout << "  Press cycles: " << final_stats.press_count << std::endl;
        std::cout << "  Deadline misses: " << final_stats.deadline_misses << std::endl;
        std::cout << "  Telemetry drops: " << final_stats.telemetry_drops << std::endl;
        std::cout << "  Timed idle polls: " << final_stats.timed_polls << std::endl;
        std::cout << "  IR frames from remote: " << receiver.get_burst_count() << std::endl;

        receiver.shutdown();
        servo.shutdown();

        std::cout << "Shutdown complete." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
