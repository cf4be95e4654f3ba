/**
 * @file PwmScheduler.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Per-channel pulse schedules in units of the global increment.
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

#include "PwmDriver.hpp"
#include <array>
#include <set>
#include <string>
#include <vector>

namespace rpireactor {

struct Pulse {
    int gpio;
    int start_step;
    int width_step;

    bool operator==(const Pulse& other) const {
        return gpio == other.gpio && start_step == other.start_step && width_step == other.width_step;
    }
};

/**
 * Validates and records pulse schedules, then forwards them to a PwmDriver.
 *
 * The increment granularity is a property of the timing source and therefore
 * shared by all channels. A channel stays initialized until shutdown(), no
 * matter how often its pulses are cleared.
 *
 * Single writer: callers serialize access.
 */
class PwmScheduler {
public:
    enum class ChannelState {
        Uninitialized,
        Initialized
    };

    explicit PwmScheduler(PwmDriver& driver);
    ~PwmScheduler();

    PwmScheduler(const PwmScheduler&) = delete;
    PwmScheduler& operator=(const PwmScheduler&) = delete;

    void setup(int increment_us = PULSE_WIDTH_INCREMENT_US_DEFAULT, TimingSource source = TimingSource::Pwm);
    void init_channel(int channel, int subcycle_us = SUBCYCLE_TIME_US_DEFAULT);
    void add_pulse(int channel, int gpio, int start_step, int width_step);
    void clear_channel(int channel);
    void clear_channel_pin(int channel, int gpio);

    // Clears every initialized channel and stops the driver. Idempotent.
    void shutdown();

    // Sets up the scheduler and the channel if needed. Throws ConflictError if
    // either already exists with a different increment or subcycle.
    void ensure_channel(int channel, int subcycle_us, int increment_us);

    bool is_setup() const { return m_setup; }
    int increment_us() const { return m_increment_us; }
    TimingSource timing_source() const { return m_source; }

    bool is_channel_initialized(int channel) const;
    ChannelState channel_state(int channel) const;
    int channel_subcycle_us(int channel) const;
    // Number of increments that fit in the channel's subcycle
    int channel_steps(int channel) const;

    std::vector<Pulse> pulses(int channel) const;
    std::vector<Pulse> pulses(int channel, int gpio) const;
    const std::set<int>& claimed_pins() const { return m_claimed_pins; }

    std::string describe_channel(int channel) const;

private:
    struct Channel {
        ChannelState state = ChannelState::Uninitialized;
        int subcycle_us = 0;
        std::vector<Pulse> pulses;
    };

    PwmDriver& m_driver;
    bool m_setup;
    int m_increment_us;
    TimingSource m_source;
    std::array<Channel, DMA_CHANNELS> m_channels;
    std::set<int> m_claimed_pins;

    const Channel& checked_channel(int channel) const;
    Channel& initialized_channel(int channel);
};

const char* to_string(PwmScheduler::ChannelState state);

} // namespace rpireactor
