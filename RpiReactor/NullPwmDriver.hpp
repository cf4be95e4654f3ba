/**
 * @file NullPwmDriver.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief PwmDriver that programs nothing and keeps a log of the calls it received.
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
#include <string>
#include <vector>

namespace rpireactor {

// Used on hosts without the DMA primitive. Every call is appended to calls()
// as a short text record, e.g. "add_pulse 0 17 25 12".
class NullPwmDriver : public PwmDriver {
public:
    void setup(int increment_us, TimingSource source) override;
    void init_channel(int channel, int subcycle_us) override;
    void add_pulse(int channel, int gpio, int start_step, int width_step) override;
    void clear_channel(int channel) override;
    void clear_channel_pin(int channel, int gpio) override;
    void shutdown() override;

    const std::vector<std::string>& calls() const { return m_calls; }
    void reset_calls() { m_calls.clear(); }

private:
    std::vector<std::string> m_calls;

    void record(const std::string& call);
};

} // namespace rpireactor
