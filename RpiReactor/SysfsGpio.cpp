/**
 * @file SysfsGpio.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Implementation of the sysfs GPIO kernel interface manager.
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

#include "SysfsGpio.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cerrno>
#include <thread>

namespace rpireactor {

namespace {

// udev may still be fixing permissions right after an export
constexpr auto ATTRIBUTE_WAIT_LIMIT = std::chrono::milliseconds(1000);
constexpr auto ATTRIBUTE_WAIT_STEP = std::chrono::milliseconds(10);

bool path_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

Edge parse_edge(const std::string& name) {
    if (name == "none") return Edge::None;
    if (name == "rising") return Edge::Rising;
    if (name == "falling") return Edge::Falling;
    if (name == "both") return Edge::Both;
    throw ConfigurationError("'" + name + "' is not a valid edge");
}

const char* to_string(Edge edge) {
    switch (edge) {
    case Edge::None: return "none";
    case Edge::Rising: return "rising";
    case Edge::Falling: return "falling";
    case Edge::Both: return "both";
    }
    return "none";
}

SysfsGpio::SysfsGpio(const std::string& root, std::chrono::milliseconds settle_time)
    : m_root(root), m_settle_time(settle_time) {
    if (!m_root.empty() && m_root.back() == '/') m_root.pop_back();
}

SysfsGpio::~SysfsGpio() {
    for (auto& entry : m_value_fds) {
        ::close(entry.second);
    }
}

std::string SysfsGpio::pin_path(int pin) const {
    return m_root + "/gpio" + std::to_string(pin);
}

int SysfsGpio::open(int pin, Edge edge) {
    const std::string path = pin_path(pin);

    // A leftover interface (from a crashed run or another program) is
    // recreated so direction and edge start from a known state.
    if (path_exists(path)) {
        log(LogLevel::Warning, "SysfsGpio") << "Kernel interface for GPIO " << pin << " already exists";
        close(pin);
        write_control("unexport", pin);
        std::this_thread::sleep_for(m_settle_time);
    }

    write_control("export", pin);
    m_exported.insert(pin);
    log(LogLevel::Debug, "SysfsGpio") << "- kernel interface exported for GPIO " << pin;

    wait_for_attribute(path + "/direction");
    write_attribute(path + "/direction", "in");
    write_attribute(path + "/edge", to_string(edge));

    int fd = open_value(pin);

    try {
        int initial = sample(fd);
        log(LogLevel::Debug, "SysfsGpio") << "- initial value of GPIO " << pin << ": " << initial;
    } catch (const ResourceError&) {
        ::close(fd);
        throw;
    }

    m_value_fds[pin] = fd;
    return fd;
}

void SysfsGpio::close(int pin) {
    auto it = m_value_fds.find(pin);
    if (it == m_value_fds.end()) return;
    ::close(it->second);
    m_value_fds.erase(it);
}

void SysfsGpio::unexport(int pin) {
    close(pin);
    if (m_exported.count(pin) == 0) return;

    log(LogLevel::Debug, "SysfsGpio") << "- unexporting GPIO " << pin;
    write_control("unexport", pin);
    m_exported.erase(pin);
}

void SysfsGpio::unexport_all() {
    const std::set<int> pins = m_exported;
    for (int pin : pins) {
        try {
            unexport(pin);
        } catch (const ResourceError& e) {
            log(LogLevel::Error, "SysfsGpio") << "Cleanup of GPIO " << pin << " failed: " << e.what();
        }
    }
}

int SysfsGpio::read_value(int fd) {
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        throw ResourceError("Failed to rewind value stream", errno);
    }

    char buf[8];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
        throw ResourceError("Failed to read value stream", errno);
    }
    if (n == 0 || (buf[0] != '0' && buf[0] != '1')) {
        throw ResourceError("Unexpected content in value stream");
    }
    return buf[0] - '0';
}

int SysfsGpio::sample(int fd) const {
    return read_value(fd);
}

int SysfsGpio::value_fd(int pin) const {
    auto it = m_value_fds.find(pin);
    return it == m_value_fds.end() ? -1 : it->second;
}

bool SysfsGpio::is_exported(int pin) const {
    return m_exported.count(pin) != 0;
}

std::set<int> SysfsGpio::exported_pins() const {
    return m_exported;
}

void SysfsGpio::write_control(const std::string& file, int pin) {
    write_attribute(m_root + "/" + file, std::to_string(pin));
}

int SysfsGpio::open_value(int pin) {
    const std::string path = pin_path(pin) + "/value";
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw ResourceError("Failed to open " + path, errno);
    }
    return fd;
}

void SysfsGpio::write_attribute(const std::string& path, const std::string& value) {
    int fd = ::open(path.c_str(), O_WRONLY | O_TRUNC);
    if (fd < 0) {
        throw ResourceError("Failed to open " + path, errno);
    }

    ssize_t written = ::write(fd, value.data(), value.size());
    int err = errno;
    ::close(fd);

    if (written != static_cast<ssize_t>(value.size())) {
        throw ResourceError("Failed to write '" + value + "' to " + path, written < 0 ? err : EIO);
    }
}

void SysfsGpio::wait_for_attribute(const std::string& path) {
    const auto deadline = std::chrono::steady_clock::now() + ATTRIBUTE_WAIT_LIMIT;
    while (::access(path.c_str(), W_OK) != 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw ResourceError("Kernel interface did not appear: " + path, errno);
        }
        std::this_thread::sleep_for(ATTRIBUTE_WAIT_STEP);
    }
}

} // namespace rpireactor
