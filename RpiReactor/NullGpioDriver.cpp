/**
 * @file NullGpioDriver.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief In-memory GpioDriver implementation.
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

#include "NullGpioDriver.hpp"

namespace rpireactor {

PinFunction NullGpioDriver::function(int gpio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pins[gpio].function;
}

void NullGpioDriver::setup(int gpio, PinFunction function, Pull pull) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pins[gpio].function = function;
    m_pins[gpio].pull = pull;
    ++m_setup_calls;
}

void NullGpioDriver::set_pull(int gpio, Pull pull) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pins[gpio].pull = pull;
}

int NullGpioDriver::input(int gpio) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pins[gpio].level;
}

void NullGpioDriver::output(int gpio, int value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pins[gpio].level = value ? 1 : 0;
}

Pull NullGpioDriver::pull(int gpio) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pins.find(gpio);
    return it == m_pins.end() ? Pull::Off : it->second.pull;
}

int NullGpioDriver::setup_calls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_setup_calls;
}

} // namespace rpireactor
