/**
 * @file Bcm2835GpioDriver.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Register-level pin function, pull and level access for BCM2835/6/7.
 * @requirements C++17, /dev/gpiomem (or /dev/mem with root privileges).
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

#include "Bcm2835GpioDriver.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <fcntl.h>      // For open() flags
#include <unistd.h>     // For close(), sysconf()
#include <sys/mman.h>   // For mmap(), munmap()
#include <cerrno>
#include <cstring>
#include <ctime>

namespace rpireactor {

namespace {

// Word offsets into the GPIO block
constexpr int OFFSET_FSEL = 0;          // 0x0000
constexpr int OFFSET_SET = 7;           // 0x001c
constexpr int OFFSET_CLR = 10;          // 0x0028
constexpr int OFFSET_PINLEVEL = 13;     // 0x0034
constexpr int OFFSET_PULLUPDN = 37;     // 0x0094
constexpr int OFFSET_PULLUPDNCLK = 38;  // 0x0098

constexpr size_t GPIO_BLOCK_SIZE = 4 * 1024;

// The pull-up/down clock sequence needs >= 150 cycles between steps
void short_wait() {
    struct timespec ts = {0, 1000};
    ::nanosleep(&ts, nullptr);
}

} // namespace

Bcm2835GpioDriver::Bcm2835GpioDriver(const std::string& device_path)
    : m_device_path(device_path), m_fd(-1), m_gpio_map(nullptr), m_mmap_size(0) {
}

Bcm2835GpioDriver::~Bcm2835GpioDriver() {
    close();
}

bool Bcm2835GpioDriver::open() {
    if (m_gpio_map != nullptr) return true;

    m_fd = ::open(m_device_path.c_str(), O_RDWR | O_SYNC);
    if (m_fd < 0) {
        log(LogLevel::Error, "Bcm2835GpioDriver") << "Failed to open device: " << m_device_path
                                                  << " Error: " << std::strerror(errno);
        return false;
    }

    long page_size = ::sysconf(_SC_PAGESIZE);
    m_mmap_size = (GPIO_BLOCK_SIZE + page_size - 1) & ~(page_size - 1);

    // /dev/gpiomem maps the GPIO block at offset 0
    void* mapped = ::mmap(NULL, m_mmap_size, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, 0);
    if (mapped == MAP_FAILED) {
        log(LogLevel::Error, "Bcm2835GpioDriver") << "mmap failed: " << std::strerror(errno);
        ::close(m_fd);
        m_fd = -1;
        return false;
    }

    m_gpio_map = static_cast<volatile uint32_t*>(mapped);
    return true;
}

void Bcm2835GpioDriver::close() {
    if (m_gpio_map != nullptr) {
        ::munmap(const_cast<uint32_t*>(m_gpio_map), m_mmap_size);
        m_gpio_map = nullptr;
    }

    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

volatile uint32_t* Bcm2835GpioDriver::registers() {
    if (m_gpio_map == nullptr) {
        throw ResourceError("GPIO register block of " + m_device_path + " is not mapped");
    }
    return m_gpio_map;
}

PinFunction Bcm2835GpioDriver::function(int gpio) {
    volatile uint32_t* map = registers();
    const int offset = OFFSET_FSEL + (gpio / 10);
    const int shift = (gpio % 10) * 3;
    return static_cast<PinFunction>((map[offset] >> shift) & 7);
}

void Bcm2835GpioDriver::setup(int gpio, PinFunction function, Pull pull) {
    volatile uint32_t* map = registers();
    const int offset = OFFSET_FSEL + (gpio / 10);
    const int shift = (gpio % 10) * 3;

    set_pull(gpio, pull);
    map[offset] = (map[offset] & ~(7u << shift)) | (static_cast<uint32_t>(function) << shift);
}

void Bcm2835GpioDriver::set_pull(int gpio, Pull pull) {
    volatile uint32_t* map = registers();
    const int clk_offset = OFFSET_PULLUPDNCLK + (gpio / 32);
    const int shift = gpio % 32;

    map[OFFSET_PULLUPDN] = (map[OFFSET_PULLUPDN] & ~3u) | static_cast<uint32_t>(pull);
    short_wait();
    map[clk_offset] = 1u << shift;
    short_wait();
    map[OFFSET_PULLUPDN] &= ~3u;
    map[clk_offset] = 0;
}

int Bcm2835GpioDriver::input(int gpio) {
    volatile uint32_t* map = registers();
    const int offset = OFFSET_PINLEVEL + (gpio / 32);
    return (map[offset] & (1u << (gpio % 32))) ? 1 : 0;
}

void Bcm2835GpioDriver::output(int gpio, int value) {
    volatile uint32_t* map = registers();
    const int offset = (value ? OFFSET_SET : OFFSET_CLR) + (gpio / 32);
    map[offset] = 1u << (gpio % 32);
}

} // namespace rpireactor
