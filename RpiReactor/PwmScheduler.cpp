/**
 * @file PwmScheduler.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Validation and bookkeeping for PWM channel schedules.
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

#include "PwmScheduler.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <algorithm>
#include <sstream>

namespace rpireactor {

const char* to_string(TimingSource source) {
    return source == TimingSource::Pcm ? "PCM" : "PWM";
}

const char* to_string(PwmScheduler::ChannelState state) {
    return state == PwmScheduler::ChannelState::Initialized ? "initialized" : "uninitialized";
}

PwmScheduler::PwmScheduler(PwmDriver& driver)
    : m_driver(driver),
      m_setup(false),
      m_increment_us(PULSE_WIDTH_INCREMENT_US_DEFAULT),
      m_source(TimingSource::Pwm) {
}

PwmScheduler::~PwmScheduler() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        log(LogLevel::Error, "PwmScheduler") << "Shutdown failed: " << e.what();
    }
}

void PwmScheduler::setup(int increment_us, TimingSource source) {
    if (m_setup) {
        throw ConflictError("setup() has already been called before");
    }
    if (increment_us <= 0) {
        throw ConfigurationError("Pulse width increment must be positive (got " + std::to_string(increment_us) + "us)");
    }

    m_driver.setup(increment_us, source);
    m_setup = true;
    m_increment_us = increment_us;
    m_source = source;
    log(LogLevel::Debug, "PwmScheduler") << "Using hardware: " << to_string(source);
    log(LogLevel::Debug, "PwmScheduler") << "PW increments:  " << increment_us << "us";
}

void PwmScheduler::init_channel(int channel, int subcycle_us) {
    if (!m_setup) {
        throw ConfigurationError("You need to call setup() before initializing channels");
    }
    if (channel < 0 || channel >= DMA_CHANNELS) {
        throw ConfigurationError("Maximum channel is " + std::to_string(DMA_CHANNELS - 1) + " (requested channel "
                                 + std::to_string(channel) + ")");
    }
    if (m_channels[channel].state == ChannelState::Initialized) {
        throw ConflictError("Channel " + std::to_string(channel) + " already initialized");
    }
    if (subcycle_us < SUBCYCLE_TIME_US_MIN) {
        throw ConfigurationError("Subcycle time " + std::to_string(subcycle_us) + "us is too small (min="
                                 + std::to_string(SUBCYCLE_TIME_US_MIN) + "us)");
    }

    log(LogLevel::Debug, "PwmScheduler") << "Initializing channel " << channel << "...";
    m_driver.init_channel(channel, subcycle_us);

    Channel& ch = m_channels[channel];
    ch.state = ChannelState::Initialized;
    ch.subcycle_us = subcycle_us;
    ch.pulses.clear();
}

void PwmScheduler::add_pulse(int channel, int gpio, int start_step, int width_step) {
    Channel& ch = initialized_channel(channel);
    const int max_steps = ch.subcycle_us / m_increment_us;

    if (start_step < 0 || width_step <= 0) {
        throw ConfigurationError("Invalid pulse: start=" + std::to_string(start_step) + ", width="
                                 + std::to_string(width_step));
    }
    if (start_step + width_step > max_steps) {
        throw ConfigurationError("Cannot add pulse to channel " + std::to_string(channel)
                                 + ": start+width exceed max width of " + std::to_string(max_steps));
    }

    log(LogLevel::Debug, "PwmScheduler") << "add_pulse: channel=" << channel << ", gpio=" << gpio
                                         << ", start=" << start_step << ", width=" << width_step;
    m_driver.add_pulse(channel, gpio, start_step, width_step);
    ch.pulses.push_back({gpio, start_step, width_step});
    m_claimed_pins.insert(gpio);
}

void PwmScheduler::clear_channel(int channel) {
    Channel& ch = initialized_channel(channel);

    log(LogLevel::Debug, "PwmScheduler") << "clear_channel: channel=" << channel;
    m_driver.clear_channel(channel);
    ch.pulses.clear();
}

void PwmScheduler::clear_channel_pin(int channel, int gpio) {
    Channel& ch = initialized_channel(channel);
    if (m_claimed_pins.count(gpio) == 0) {
        throw NotFoundError("Cannot clear gpio " + std::to_string(gpio) + "; not yet been set up");
    }

    log(LogLevel::Debug, "PwmScheduler") << "clear_channel_pin: channel=" << channel << ", gpio=" << gpio;
    m_driver.clear_channel_pin(channel, gpio);
    ch.pulses.erase(std::remove_if(ch.pulses.begin(), ch.pulses.end(),
                                   [gpio](const Pulse& p) { return p.gpio == gpio; }),
                    ch.pulses.end());
}

void PwmScheduler::shutdown() {
    if (!m_setup) return;

    for (int i = 0; i < DMA_CHANNELS; ++i) {
        Channel& ch = m_channels[i];
        if (ch.state != ChannelState::Initialized) continue;
        log(LogLevel::Debug, "PwmScheduler") << "shutting down dma channel " << i;
        m_driver.clear_channel(i);
        ch = Channel();
    }
    m_driver.shutdown();

    m_claimed_pins.clear();
    m_setup = false;
    m_increment_us = PULSE_WIDTH_INCREMENT_US_DEFAULT;
    m_source = TimingSource::Pwm;
}

void PwmScheduler::ensure_channel(int channel, int subcycle_us, int increment_us) {
    checked_channel(channel);
    if (m_setup && m_increment_us != increment_us) {
        throw ConflictError("Scheduler already set up with increment " + std::to_string(m_increment_us)
                            + "us (requested " + std::to_string(increment_us) + "us)");
    }
    if (is_channel_initialized(channel) && m_channels[channel].subcycle_us != subcycle_us) {
        throw ConflictError("Channel " + std::to_string(channel) + " already initialized with subcycle "
                            + std::to_string(m_channels[channel].subcycle_us) + "us (requested "
                            + std::to_string(subcycle_us) + "us)");
    }
    if (subcycle_us < SUBCYCLE_TIME_US_MIN) {
        throw ConfigurationError("Subcycle time " + std::to_string(subcycle_us) + "us is too small (min="
                                 + std::to_string(SUBCYCLE_TIME_US_MIN) + "us)");
    }

    if (!m_setup) setup(increment_us);
    if (!is_channel_initialized(channel)) init_channel(channel, subcycle_us);
}

bool PwmScheduler::is_channel_initialized(int channel) const {
    return channel >= 0 && channel < DMA_CHANNELS && m_channels[channel].state == ChannelState::Initialized;
}

PwmScheduler::ChannelState PwmScheduler::channel_state(int channel) const {
    return checked_channel(channel).state;
}

int PwmScheduler::channel_subcycle_us(int channel) const {
    return checked_channel(channel).subcycle_us;
}

int PwmScheduler::channel_steps(int channel) const {
    const Channel& ch = checked_channel(channel);
    return ch.subcycle_us / m_increment_us;
}

std::vector<Pulse> PwmScheduler::pulses(int channel) const {
    return checked_channel(channel).pulses;
}

std::vector<Pulse> PwmScheduler::pulses(int channel, int gpio) const {
    std::vector<Pulse> result;
    for (const Pulse& p : checked_channel(channel).pulses) {
        if (p.gpio == gpio) result.push_back(p);
    }
    return result;
}

std::string PwmScheduler::describe_channel(int channel) const {
    const Channel& ch = checked_channel(channel);

    std::ostringstream out;
    out << "Channel " << channel << " (" << to_string(ch.state) << ")\n";
    out << "Subcycle time: " << ch.subcycle_us << "us\n";
    out << "PW Increments: " << m_increment_us << "us\n";
    out << "Num samples:   " << (ch.subcycle_us / m_increment_us) << "\n";
    out << "Num pulses:    " << ch.pulses.size() << "\n";
    for (const Pulse& p : ch.pulses) {
        out << "  gpio " << p.gpio << ": start=" << p.start_step << " width=" << p.width_step << "\n";
    }
    return out.str();
}

const PwmScheduler::Channel& PwmScheduler::checked_channel(int channel) const {
    if (channel < 0 || channel >= DMA_CHANNELS) {
        throw ConfigurationError("Maximum channel is " + std::to_string(DMA_CHANNELS - 1) + " (requested channel "
                                 + std::to_string(channel) + ")");
    }
    return m_channels[channel];
}

PwmScheduler::Channel& PwmScheduler::initialized_channel(int channel) {
    checked_channel(channel);
    Channel& ch = m_channels[channel];
    if (ch.state != ChannelState::Initialized) {
        throw ConfigurationError("Channel " + std::to_string(channel)
                                 + " has not been initialized with init_channel()");
    }
    return ch;
}

} // namespace rpireactor
