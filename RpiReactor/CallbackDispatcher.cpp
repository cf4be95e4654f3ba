/**
 * @file CallbackDispatcher.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Sync/threaded callback dispatch.
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

#include "CallbackDispatcher.hpp"
#include "Log.hpp"

namespace rpireactor {

CallbackDispatcher::CallbackDispatcher(size_t num_threads, size_t queue_capacity)
    : m_pool(num_threads, queue_capacity) {
}

bool CallbackDispatcher::dispatch(DispatchMode mode, std::function<void()> invocation) {
    if (mode == DispatchMode::Sync) {
        invocation();
        return true;
    }

    if (!m_pool.submit(std::move(invocation))) {
        log(LogLevel::Warning, "CallbackDispatcher") << "Worker queue full (" << m_pool.capacity()
                                                     << " tasks), event dropped";
        return false;
    }
    return true;
}

} // namespace rpireactor
