/**
 * @file DebounceFilter.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Edge-validity and debounce gate.
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

#include "DebounceFilter.hpp"

namespace rpireactor {

DebounceFilter::DebounceFilter(Edge edge, std::chrono::milliseconds window)
    : m_edge(edge), m_window(window) {
}

bool DebounceFilter::accept(int value, Clock::time_point now) {
    if ((m_edge == Edge::Rising && value == 0) || (m_edge == Edge::Falling && value == 1)) {
        return false;
    }

    if (m_window.count() > 0) {
        if (m_last_trigger && now - *m_last_trigger < m_window) {
            return false;
        }
        m_last_trigger = now;
    }
    return true;
}

} // namespace rpireactor
