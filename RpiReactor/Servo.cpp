/**
 * @file Servo.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Servo pulse helper.
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

#include "Servo.hpp"
#include "Errors.hpp"
#include "Log.hpp"

namespace rpireactor {

Servo::Servo(PwmScheduler& scheduler, int channel, int subcycle_us, int increment_us)
    : m_scheduler(scheduler), m_channel(channel), m_subcycle_us(subcycle_us), m_increment_us(increment_us) {
    if (increment_us <= 0) {
        throw ConfigurationError("Pulse width increment must be positive");
    }
}

void Servo::set_servo(int gpio, int width_us) {
    if (width_us <= 0 || width_us % m_increment_us != 0) {
        throw ConfigurationError("Pulse width " + std::to_string(width_us) + "us is not a positive multiple of "
                                 + std::to_string(m_increment_us) + "us");
    }
    if (width_us > m_subcycle_us) {
        throw ConfigurationError("Pulse width " + std::to_string(width_us) + "us exceeds the subcycle of "
                                 + std::to_string(m_subcycle_us) + "us");
    }

    m_scheduler.ensure_channel(m_channel, m_subcycle_us, m_increment_us);

    log(LogLevel::Info, "Servo") << "Set servo at GPIO " << gpio << " to " << width_us << "us";
    if (!m_scheduler.pulses(m_channel, gpio).empty()) {
        m_scheduler.clear_channel_pin(m_channel, gpio);
    }
    m_scheduler.add_pulse(m_channel, gpio, 0, width_us / m_increment_us);
}

void Servo::stop_servo(int gpio) {
    if (!m_scheduler.is_channel_initialized(m_channel)) return;
    if (m_scheduler.pulses(m_channel, gpio).empty()) return;
    m_scheduler.clear_channel_pin(m_channel, gpio);
}

} // namespace rpireactor
