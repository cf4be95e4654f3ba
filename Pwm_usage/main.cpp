/**
 * @file main.cpp
 * @brief Example application: pulse trains and servo pulses planned with PwmScheduler.
 */

#include <iostream>
#include <iomanip>
#include "Errors.hpp"
#include "Log.hpp"
#include "NullPwmDriver.hpp"
#include "PulseGenerator.hpp"
#include "PwmScheduler.hpp"
#include "Servo.hpp"

using namespace rpireactor;

namespace {

void print_plan(int gpio, const PulsePlan& plan) {
    std::cout << "GPIO " << gpio << ": " << plan.periods_per_subcycle << " periods x "
              << plan.period_steps << " steps (width " << plan.pulse_width_steps
              << ", pause " << plan.pause_steps << ")\n";
    std::cout << "  requested " << std::fixed << std::setprecision(2) << plan.requested_freq_hz
              << " Hz, actual " << plan.actual_freq_hz << " Hz\n";
}

} // namespace

int main() {
    set_log_level(LogLevel::Info);

    // No DMA primitive in this build: the driver only records the schedule
    NullPwmDriver driver;
    PwmScheduler scheduler(driver);

    try {
        PulseGenerator generator(scheduler, 10000, 10);
        std::cout << "[Main] Frequency range: " << generator.freq_min() << " Hz .. "
                  << generator.freq_max() << " Hz\n";

        print_plan(17, generator.set_frequency(17, 400));
        print_plan(17, generator.set_frequency(17, 400, "10%"));
        print_plan(17, generator.set_frequency(17, 400, "20us"));
        print_plan(18, generator.set_frequency(18, 333, "50%"));

        std::cout << scheduler.describe_channel(0);
        generator.stop(17);
        generator.stop(18);

        Servo servo(scheduler, 1);
        servo.set_servo(23, 1200);
        std::cout << scheduler.describe_channel(1);
        servo.set_servo(23, 1800);
        std::cout << scheduler.describe_channel(1);
        servo.stop_servo(23);
    } catch (const RpiReactorError& e) {
        std::cerr << ANSI_RED << "[Main] " << e.what() << ANSI_RESET << "\n";
        scheduler.shutdown();
        return 1;
    }

    scheduler.shutdown();
    std::cout << "[Main] " << driver.calls().size() << " driver calls issued.\n";
    return 0;
}
