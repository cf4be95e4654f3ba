/**
 * @file PwmDriver.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Interface to the DMA/PWM channel-programming primitive.
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

namespace rpireactor {

constexpr int SUBCYCLE_TIME_US_DEFAULT = 20000;
constexpr int SUBCYCLE_TIME_US_MIN = 3000;
constexpr int PULSE_WIDTH_INCREMENT_US_DEFAULT = 10;
constexpr int DMA_CHANNELS = 15;

// Hardware block that paces the DMA engine
enum class TimingSource {
    Pwm = 0,
    Pcm = 1
};

const char* to_string(TimingSource source);

/**
 * The primitive that replays a programmed pulse schedule without CPU
 * involvement. Arguments are already validated by PwmScheduler; an
 * implementation only throws on hardware failure (ResourceError).
 */
class PwmDriver {
public:
    virtual ~PwmDriver() = default;

    virtual void setup(int increment_us, TimingSource source) = 0;
    virtual void init_channel(int channel, int subcycle_us) = 0;
    virtual void add_pulse(int channel, int gpio, int start_step, int width_step) = 0;
    virtual void clear_channel(int channel) = 0;
    virtual void clear_channel_pin(int channel, int gpio) = 0;
    virtual void shutdown() = 0;
};

} // namespace rpireactor
