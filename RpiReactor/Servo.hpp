/**
 * @file Servo.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Single-pulse-per-subcycle helper for hobby servos.
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

namespace rpireactor {

// One pulse of the requested width at the start of every subcycle
// (20 ms by default, the usual servo frame).
class Servo {
public:
    explicit Servo(PwmScheduler& scheduler, int channel = 0,
                   int subcycle_us = SUBCYCLE_TIME_US_DEFAULT,
                   int increment_us = PULSE_WIDTH_INCREMENT_US_DEFAULT);

    // width_us must be a positive multiple of the increment.
    void set_servo(int gpio, int width_us);
    void stop_servo(int gpio);

    int channel() const { return m_channel; }

private:
    PwmScheduler& m_scheduler;
    int m_channel;
    int m_subcycle_us;
    int m_increment_us;
};

} // namespace rpireactor
