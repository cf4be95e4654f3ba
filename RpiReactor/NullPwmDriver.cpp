/**
 * @file NullPwmDriver.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Call-recording PwmDriver.
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

#include "NullPwmDriver.hpp"
#include "Log.hpp"

namespace rpireactor {

void NullPwmDriver::setup(int increment_us, TimingSource source) {
    record("setup " + std::to_string(increment_us) + " " + to_string(source));
}

void NullPwmDriver::init_channel(int channel, int subcycle_us) {
    record("init_channel " + std::to_string(channel) + " " + std::to_string(subcycle_us));
}

void NullPwmDriver::add_pulse(int channel, int gpio, int start_step, int width_step) {
    record("add_pulse " + std::to_string(channel) + " " + std::to_string(gpio) + " "
           + std::to_string(start_step) + " " + std::to_string(width_step));
}

void NullPwmDriver::clear_channel(int channel) {
    record("clear_channel " + std::to_string(channel));
}

void NullPwmDriver::clear_channel_pin(int channel, int gpio) {
    record("clear_channel_pin " + std::to_string(channel) + " " + std::to_string(gpio));
}

void NullPwmDriver::shutdown() {
    record("shutdown");
}

void NullPwmDriver::record(const std::string& call) {
    log(LogLevel::Debug, "NullPwmDriver") << call;
    m_calls.push_back(call);
}

} // namespace rpireactor
