/**
 * @file Bcm2835GpioDriver.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief GpioDriver backed by the memory-mapped BCM2835 GPIO register block.
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

#pragma once

#include "GpioDriver.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace rpireactor {

class Bcm2835GpioDriver : public GpioDriver {
public:
    explicit Bcm2835GpioDriver(const std::string& device_path = "/dev/gpiomem");
    ~Bcm2835GpioDriver() override;

    Bcm2835GpioDriver(const Bcm2835GpioDriver&) = delete;
    Bcm2835GpioDriver& operator=(const Bcm2835GpioDriver&) = delete;

    bool open();
    void close();
    bool is_open() const { return m_gpio_map != nullptr; }

    PinFunction function(int gpio) override;
    void setup(int gpio, PinFunction function, Pull pull) override;
    void set_pull(int gpio, Pull pull) override;
    int input(int gpio) override;
    void output(int gpio, int value) override;

private:
    std::string m_device_path;
    int m_fd;
    volatile uint32_t* m_gpio_map;
    size_t m_mmap_size;

    volatile uint32_t* registers();
};

} // namespace rpireactor
