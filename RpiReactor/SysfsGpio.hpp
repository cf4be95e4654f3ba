/**
 * @file SysfsGpio.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Export, configure and open the /sys/class/gpio interface of a pin.
 * @requirements C++17, Linux with CONFIG_GPIO_SYSFS.
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

#include <chrono>
#include <map>
#include <set>
#include <string>

namespace rpireactor {

enum class Edge {
    None,
    Rising,
    Falling,
    Both
};

Edge parse_edge(const std::string& name);
const char* to_string(Edge edge);

/**
 * Owns the kernel interfaces this process exported and the value streams it
 * opened on them. Only pins recorded here are ever unexported, so interfaces
 * created by other programs are left alone.
 *
 * Not thread-safe; the Reactor serializes access with its registry lock.
 */
class SysfsGpio {
public:
    explicit SysfsGpio(const std::string& root = "/sys/class/gpio",
                       std::chrono::milliseconds settle_time = std::chrono::milliseconds(100));
    virtual ~SysfsGpio();

    SysfsGpio(const SysfsGpio&) = delete;
    SysfsGpio& operator=(const SysfsGpio&) = delete;

    // Exports (or re-exports) the pin as an input with the given edge and
    // returns its value fd. Throws ResourceError on any I/O failure.
    int open(int pin, Edge edge);

    // Closes the value fd, keeps the interface exported.
    void close(int pin);

    // Closes the value fd and removes the interface. No-op for pins this
    // process never exported.
    void unexport(int pin);

    // Best-effort unexport of every recorded pin. Failures are logged.
    void unexport_all();

    // Rewinds the stream and reads the "0"/"1" value.
    static int read_value(int fd);

    // Current level of a pin, read from a value fd returned by open().
    virtual int sample(int fd) const;

    int value_fd(int pin) const;
    bool is_exported(int pin) const;
    std::set<int> exported_pins() const;
    const std::string& root() const { return m_root; }

protected:
    // Writes the decimal pin id to <root>/<file> ("export" or "unexport").
    virtual void write_control(const std::string& file, int pin);

    // Opens the value attribute of an exported pin for reading.
    virtual int open_value(int pin);

    std::string pin_path(int pin) const;

private:
    std::string m_root;
    std::chrono::milliseconds m_settle_time;
    std::set<int> m_exported;
    std::map<int, int> m_value_fds;

    void write_attribute(const std::string& path, const std::string& value);
    void wait_for_attribute(const std::string& path);
};

} // namespace rpireactor
