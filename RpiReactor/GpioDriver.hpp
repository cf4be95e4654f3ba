/**
 * @file GpioDriver.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Primitive pin configuration interface used by the interrupt registry.
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

#include <string>

namespace rpireactor {

enum class Pull {
    Off = 0,
    Down = 1,
    Up = 2
};

// Values of the 3-bit GPFSEL field
enum class PinFunction {
    Input = 0,
    Output = 1,
    Alt5 = 2,
    Alt4 = 3,
    Alt0 = 4,
    Alt1 = 5,
    Alt2 = 6,
    Alt3 = 7
};

Pull parse_pull(const std::string& name);
const char* to_string(Pull pull);
const char* to_string(PinFunction function);

class GpioDriver {
public:
    virtual ~GpioDriver() = default;

    virtual PinFunction function(int gpio) = 0;
    virtual void setup(int gpio, PinFunction function, Pull pull) = 0;
    virtual void set_pull(int gpio, Pull pull) = 0;
    virtual int input(int gpio) = 0;
    virtual void output(int gpio, int value) = 0;
};

} // namespace rpireactor
