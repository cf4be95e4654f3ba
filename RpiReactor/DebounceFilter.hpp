/**
 * @file DebounceFilter.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Per-pin gate rejecting edge-inconsistent values and bounces.
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

#include "SysfsGpio.hpp"
#include <chrono>
#include <optional>

namespace rpireactor {

class DebounceFilter {
public:
    using Clock = std::chrono::steady_clock;

    explicit DebounceFilter(Edge edge,
                            std::chrono::milliseconds window = std::chrono::milliseconds(0));

    // The kernel sometimes reports the opposite level right after an edge
    // (a 0 on a rising-only pin). Those values are dropped here, before the
    // debounce window is consulted, and do not restart it.
    bool accept(int value, Clock::time_point now);

    Edge edge() const { return m_edge; }
    std::chrono::milliseconds window() const { return m_window; }
    std::optional<Clock::time_point> last_trigger() const { return m_last_trigger; }

private:
    Edge m_edge;
    std::chrono::milliseconds m_window;
    std::optional<Clock::time_point> m_last_trigger;
};

} // namespace rpireactor
