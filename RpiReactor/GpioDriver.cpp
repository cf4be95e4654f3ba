/**
 * @file GpioDriver.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Name conversions for pull resistors and pin functions.
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

#include "GpioDriver.hpp"
#include "Errors.hpp"

namespace rpireactor {

Pull parse_pull(const std::string& name) {
    if (name == "off") return Pull::Off;
    if (name == "down") return Pull::Down;
    if (name == "up") return Pull::Up;
    throw ConfigurationError("'" + name + "' is not a valid pull_up_down value");
}

const char* to_string(Pull pull) {
    switch (pull) {
    case Pull::Off: return "PUD_OFF";
    case Pull::Down: return "PUD_DOWN";
    case Pull::Up: return "PUD_UP";
    }
    return "?";
}

const char* to_string(PinFunction function) {
    switch (function) {
    case PinFunction::Input: return "INPUT";
    case PinFunction::Output: return "OUTPUT";
    case PinFunction::Alt0: return "ALT0";
    case PinFunction::Alt1: return "ALT1";
    case PinFunction::Alt2: return "ALT2";
    case PinFunction::Alt3: return "ALT3";
    case PinFunction::Alt4: return "ALT4";
    case PinFunction::Alt5: return "ALT5";
    }
    return "-";
}

} // namespace rpireactor
