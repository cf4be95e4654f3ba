/**
 * @file InterruptRegistry.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Registration, filtering and lookup of GPIO interrupt sources.
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

#include "InterruptRegistry.hpp"
#include "Errors.hpp"
#include "Log.hpp"

namespace rpireactor {

InterruptRegistry::InterruptRegistry(GpioDriver& driver, SysfsGpio& sysfs, BoardRevision revision)
    : m_driver(driver), m_sysfs(sysfs), m_revision(revision) {
}

int InterruptRegistry::add(int pin, InterruptCallback callback, Edge edge, Pull pull,
                           int debounce_ms, DispatchMode mode) {
    log(LogLevel::Debug, "InterruptRegistry") << "Adding callback for GPIO " << pin;

    if (!is_valid_gpio(m_revision, pin)) {
        throw ConfigurationError("GPIO " + std::to_string(pin) + " is not a valid gpio-id for this board ("
                                 + to_string(m_revision) + ")");
    }
    if (!callback) {
        throw ConfigurationError("No callback given for GPIO " + std::to_string(pin));
    }
    if (debounce_ms < 0) {
        throw ConfigurationError("Debounce timeout must not be negative");
    }

    auto it = m_sources.find(pin);
    if (it != m_sources.end() && it->second.edge != edge) {
        throw ConflictError("Cannot add callback for gpio " + std::to_string(pin) + ": edge detection '"
                            + to_string(edge) + "' not compatible with existing edge detection '"
                            + to_string(it->second.edge) + "'");
    }

    configure_input(pin, pull);

    if (it != m_sources.end()) {
        log(LogLevel::Debug, "InterruptRegistry") << "- kernel interface already configured for GPIO " << pin;
        it->second.subscribers.push_back({std::move(callback), mode});
        return it->second.fd;
    }

    int fd = m_sysfs.open(pin, edge);
    log(LogLevel::Debug, "InterruptRegistry") << "- kernel interface configured for GPIO " << pin
                                              << " (edge='" << to_string(edge) << "', pullupdn="
                                              << to_string(pull) << ")";

    InterruptSource source{pin, fd, edge, pull,
                           DebounceFilter(edge, std::chrono::milliseconds(debounce_ms)), {}};
    source.subscribers.push_back({std::move(callback), mode});
    m_sources.emplace(pin, std::move(source));
    m_fd_to_pin[fd] = pin;
    return fd;
}

void InterruptRegistry::remove(int pin) {
    auto it = m_sources.find(pin);
    if (it == m_sources.end()) {
        throw NotFoundError("No interrupt callbacks registered for GPIO " + std::to_string(pin));
    }

    log(LogLevel::Debug, "InterruptRegistry") << "- removing interrupts on GPIO " << pin;
    m_fd_to_pin.erase(it->second.fd);
    m_sources.erase(it);

    // Close last: if it fails the registry is already consistent
    m_sysfs.close(pin);
}

void InterruptRegistry::clear() {
    for (auto& entry : m_sources) {
        m_sysfs.close(entry.first);
    }
    m_sources.clear();
    m_fd_to_pin.clear();
}

std::vector<InterruptSubscriber> InterruptRegistry::accept(int pin, int value,
                                                           DebounceFilter::Clock::time_point now) {
    auto it = m_sources.find(pin);
    if (it == m_sources.end()) return {};

    if (!it->second.filter.accept(value, now)) {
        log(LogLevel::Debug, "InterruptRegistry") << "- GPIO " << pin << " value " << value << " filtered";
        return {};
    }
    return it->second.subscribers;
}

bool InterruptRegistry::contains(int pin) const {
    return m_sources.count(pin) != 0;
}

std::optional<int> InterruptRegistry::pin_for_fd(int fd) const {
    auto it = m_fd_to_pin.find(fd);
    if (it == m_fd_to_pin.end()) return std::nullopt;
    return it->second;
}

std::vector<int> InterruptRegistry::value_fds() const {
    std::vector<int> fds;
    fds.reserve(m_fd_to_pin.size());
    for (const auto& entry : m_fd_to_pin) fds.push_back(entry.first);
    return fds;
}

std::vector<int> InterruptRegistry::pins() const {
    std::vector<int> result;
    result.reserve(m_sources.size());
    for (const auto& entry : m_sources) result.push_back(entry.first);
    return result;
}

size_t InterruptRegistry::callback_count(int pin) const {
    auto it = m_sources.find(pin);
    return it == m_sources.end() ? 0 : it->second.subscribers.size();
}

Edge InterruptRegistry::edge(int pin) const {
    auto it = m_sources.find(pin);
    if (it == m_sources.end()) {
        throw NotFoundError("No interrupt callbacks registered for GPIO " + std::to_string(pin));
    }
    return it->second.edge;
}

void InterruptRegistry::configure_input(int pin, Pull pull) {
    PinFunction current = m_driver.function(pin);
    if (current == PinFunction::Input) {
        m_driver.set_pull(pin, pull);
    } else {
        log(LogLevel::Debug, "InterruptRegistry") << "- changing gpio function from " << to_string(current)
                                                  << " to INPUT";
        m_driver.setup(pin, PinFunction::Input, pull);
    }
}

} // namespace rpireactor
