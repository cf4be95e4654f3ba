/**
 * @file PulseGenerator.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Frequency/duty to pulse-schedule conversion.
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

#include "PulseGenerator.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <cctype>
#include <cmath>

namespace rpireactor {

namespace {

int parse_non_negative(const std::string& digits, const std::string& original) {
    if (digits.empty() || digits.size() > 9) {
        throw ConfigurationError("Invalid duty '" + original + "'");
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigurationError("Invalid duty '" + original + "'");
        }
    }
    return std::stoi(digits);
}

std::string strip(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

} // namespace

Duty Duty::parse(const std::string& text) {
    const std::string s = strip(text);

    if (!s.empty() && s.back() == '%') {
        return percent(parse_non_negative(strip(s.substr(0, s.size() - 1)), text));
    }
    if (s.size() > 2 && s.compare(s.size() - 2, 2, "us") == 0) {
        return microseconds(parse_non_negative(strip(s.substr(0, s.size() - 2)), text));
    }
    throw ConfigurationError("Invalid duty '" + text + "': use '<n>%' or '<n>us'");
}

Duty Duty::percent(int n) {
    if (n < 0 || n > 99) {
        throw ConfigurationError("Duty percentage must be in 0..99 (got " + std::to_string(n) + ")");
    }
    return Duty{Unit::Percent, n};
}

Duty Duty::microseconds(int n) {
    if (n <= 0) {
        throw ConfigurationError("Pulse width must be positive (got " + std::to_string(n) + "us)");
    }
    return Duty{Unit::Microseconds, n};
}

PulseGenerator::PulseGenerator(PwmScheduler& scheduler, int subcycle_us, int increment_us)
    : m_scheduler(scheduler), m_subcycle_us(subcycle_us), m_increment_us(increment_us) {
    if (increment_us <= 0) {
        throw ConfigurationError("Pulse width increment must be positive");
    }
    if (subcycle_us < SUBCYCLE_TIME_US_MIN) {
        throw ConfigurationError("Subcycle time " + std::to_string(subcycle_us) + "us is too small (min="
                                 + std::to_string(SUBCYCLE_TIME_US_MIN) + "us)");
    }
}

double PulseGenerator::freq_min() const {
    return 1e6 / m_subcycle_us;
}

double PulseGenerator::freq_max() const {
    return 1e6 / (2.0 * m_increment_us);
}

PulsePlan PulseGenerator::set_frequency(int gpio, double freq_hz, const std::string& duty, int channel) {
    return set_frequency(gpio, freq_hz, Duty::parse(duty), channel);
}

PulsePlan PulseGenerator::set_frequency(int gpio, double freq_hz, const Duty& duty, int channel) {
    if (!(freq_hz <= freq_max())) {
        throw ConfigurationError("Frequency " + std::to_string(freq_hz) + "Hz above maximum of "
                                 + std::to_string(freq_max()) + "Hz at " + std::to_string(m_increment_us)
                                 + "us granularity");
    }
    if (freq_hz < freq_min()) {
        throw ConfigurationError("Frequency " + std::to_string(freq_hz) + "Hz below minimum of "
                                 + std::to_string(freq_min()) + "Hz for a " + std::to_string(m_subcycle_us)
                                 + "us subcycle");
    }

    PulsePlan plan;
    plan.requested_freq_hz = freq_hz;
    plan.periods_per_subcycle = static_cast<int>(std::floor(freq_hz * m_subcycle_us / 1e6));
    if (plan.periods_per_subcycle < 1) {
        throw ConfigurationError("Frequency " + std::to_string(freq_hz) + "Hz does not fit one subcycle");
    }

    const double period_time_us = static_cast<double>(m_subcycle_us) / plan.periods_per_subcycle;
    if (period_time_us < m_increment_us) {
        throw ConfigurationError("Period of " + std::to_string(period_time_us) + "us cannot be represented at "
                                 + std::to_string(m_increment_us) + "us granularity");
    }
    plan.period_steps = static_cast<int>(std::floor(period_time_us / m_increment_us));

    if (duty.unit == Duty::Unit::Percent) {
        plan.pulse_width_steps = plan.period_steps * duty.value / 100;
    } else {
        plan.pulse_width_steps = duty.value / m_increment_us;
        if (plan.pulse_width_steps < 1) {
            throw ConfigurationError("Pulse width " + std::to_string(duty.value) + "us is shorter than one "
                                     + std::to_string(m_increment_us) + "us increment");
        }
    }
    if (plan.pulse_width_steps > plan.period_steps) {
        throw ConfigurationError("Pulse width of " + std::to_string(plan.pulse_width_steps)
                                 + " steps exceeds the period of " + std::to_string(plan.period_steps) + " steps");
    }
    plan.pause_steps = plan.period_steps - plan.pulse_width_steps;
    plan.actual_freq_hz = plan.periods_per_subcycle * 1e6 / m_subcycle_us;

    m_scheduler.ensure_channel(channel, m_subcycle_us, m_increment_us);

    if (!m_scheduler.pulses(channel, gpio).empty()) {
        m_scheduler.clear_channel_pin(channel, gpio);
    }

    if (plan.pulse_width_steps > 0) {
        for (int i = 0; i < plan.periods_per_subcycle; ++i) {
            const int start = (plan.pulse_width_steps + plan.pause_steps) * i;
            m_scheduler.add_pulse(channel, gpio, start, plan.pulse_width_steps);
            plan.start_steps.push_back(start);
        }
    }

    log(LogLevel::Debug, "PulseGenerator") << "gpio " << gpio << ": " << plan.periods_per_subcycle
                                           << " periods of " << plan.period_steps << " steps, width "
                                           << plan.pulse_width_steps << ", pause " << plan.pause_steps;
    if (plan.actual_freq_hz != freq_hz) {
        log(LogLevel::Info, "PulseGenerator") << "gpio " << gpio << ": requested " << freq_hz
                                              << "Hz, actual " << plan.actual_freq_hz << "Hz";
    }
    return plan;
}

void PulseGenerator::stop(int gpio, int channel) {
    if (!m_scheduler.is_channel_initialized(channel)) return;
    if (m_scheduler.pulses(channel, gpio).empty()) return;
    m_scheduler.clear_channel_pin(channel, gpio);
}

} // namespace rpireactor
