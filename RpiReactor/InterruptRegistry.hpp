/**
 * @file InterruptRegistry.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Pin -> value stream -> callback list bookkeeping for GPIO interrupts.
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

#include "Board.hpp"
#include "CallbackDispatcher.hpp"
#include "DebounceFilter.hpp"
#include "GpioDriver.hpp"
#include "SysfsGpio.hpp"
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace rpireactor {

using InterruptCallback = std::function<void(int gpio, int value)>;

struct InterruptSubscriber {
    InterruptCallback callback;
    DispatchMode mode;
};

/**
 * At most one InterruptSource exists per pin. Every callback on a source
 * shares its edge; the debounce window is fixed by the first registration.
 *
 * Not thread-safe; the Reactor holds its registry lock around every call.
 */
class InterruptRegistry {
public:
    InterruptRegistry(GpioDriver& driver, SysfsGpio& sysfs, BoardRevision revision);

    // Validates, configures the pin as input with the given pull and either
    // appends to the existing source or exports a new one. Returns the value fd.
    int add(int pin, InterruptCallback callback, Edge edge, Pull pull,
            int debounce_ms, DispatchMode mode);

    // Closes the value stream and drops every callback of the pin.
    void remove(int pin);

    // Removes every source. Used by cleanup.
    void clear();

    // Runs the pin's filter and returns the callbacks to invoke, in
    // registration order. Empty if the event is filtered or the pin unknown.
    std::vector<InterruptSubscriber> accept(int pin, int value, DebounceFilter::Clock::time_point now);

    bool contains(int pin) const;
    std::optional<int> pin_for_fd(int fd) const;
    std::vector<int> value_fds() const;
    std::vector<int> pins() const;
    size_t callback_count(int pin) const;
    Edge edge(int pin) const;

private:
    struct InterruptSource {
        int pin;
        int fd;
        Edge edge;
        Pull pull;
        DebounceFilter filter;
        std::vector<InterruptSubscriber> subscribers;
    };

    GpioDriver& m_driver;
    SysfsGpio& m_sysfs;
    BoardRevision m_revision;
    std::map<int, InterruptSource> m_sources;
    std::map<int, int> m_fd_to_pin;

    void configure_input(int pin, Pull pull);
};

} // namespace rpireactor
