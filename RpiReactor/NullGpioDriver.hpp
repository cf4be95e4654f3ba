/**
 * @file NullGpioDriver.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief In-memory GpioDriver for hosts without the GPIO block (tests, CI).
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

#include "GpioDriver.hpp"
#include <map>
#include <mutex>

namespace rpireactor {

// Remembers function, pull and level per pin. Unknown pins read as INPUT/PUD_OFF/0.
class NullGpioDriver : public GpioDriver {
public:
    PinFunction function(int gpio) override;
    void setup(int gpio, PinFunction function, Pull pull) override;
    void set_pull(int gpio, Pull pull) override;
    int input(int gpio) override;
    void output(int gpio, int value) override;

    Pull pull(int gpio) const;
    int setup_calls() const;

private:
    struct PinState {
        PinFunction function = PinFunction::Input;
        Pull pull = Pull::Off;
        int level = 0;
    };

    mutable std::mutex m_mutex;
    std::map<int, PinState> m_pins;
    int m_setup_calls = 0;
};

} // namespace rpireactor
