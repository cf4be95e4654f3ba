/**
 * @file PulseGenerator.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Turns a frequency and duty cycle into an evenly spaced pulse train.
 * @requirements C++17
 * * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 * * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "PwmScheduler.hpp"
#include <string>
#include <vector>

namespace rpireactor {

// Pulse width request: either a percentage of the period or an absolute width.
struct Duty {
    enum class Unit {
        Percent,
        Microseconds
    };

    Unit unit;
    int value;

    // Accepts "<n>%" with n in 0..99, or "<n>us" / "<n> us" with n > 0.
    static Duty parse(const std::string& text);

    static Duty percent(int n);
    static Duty microseconds(int n);
};

struct PulsePlan {
    int periods_per_subcycle = 0;
    int period_steps = 0;
    int pulse_width_steps = 0;
    int pause_steps = 0;
    std::vector<int> start_steps;
    double requested_freq_hz = 0.0;
    double actual_freq_hz = 0.0;
};

/**
 * Frequency-oriented front end to PwmScheduler.
 *
 * Within one subcycle the generator emits floor(freq * subcycle) identical
 * periods. Integer rounding means the output frequency can differ from the
 * request; the difference is reported in the returned PulsePlan and logged,
 * never corrected.
 */
class PulseGenerator {
public:
    explicit PulseGenerator(PwmScheduler& scheduler,
                            int subcycle_us = SUBCYCLE_TIME_US_DEFAULT,
                            int increment_us = PULSE_WIDTH_INCREMENT_US_DEFAULT);

    double freq_min() const;
    double freq_max() const;

    PulsePlan set_frequency(int gpio, double freq_hz, const std::string& duty = "50%", int channel = 0);
    PulsePlan set_frequency(int gpio, double freq_hz, const Duty& duty, int channel = 0);

    // Removes the pin's pulses from the channel.
    void stop(int gpio, int channel = 0);

    int subcycle_us() const { return m_subcycle_us; }
    int increment_us() const { return m_increment_us; }

private:
    PwmScheduler& m_scheduler;
    int m_subcycle_us;
    int m_increment_us;
};

} // namespace rpireactor
