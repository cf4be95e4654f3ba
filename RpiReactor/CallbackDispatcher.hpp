/**
 * @file CallbackDispatcher.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Runs user callbacks inline on the loop thread or on the worker pool.
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

#include "WorkerPool.hpp"
#include <functional>

namespace rpireactor {

enum class DispatchMode {
    // Runs on the loop thread. Every other pending event waits for it.
    Sync,
    // Queued on the worker pool. Dropped (with a warning) if the queue is full.
    Threaded
};

class CallbackDispatcher {
public:
    explicit CallbackDispatcher(size_t num_threads = 4, size_t queue_capacity = 256);

    // Sync exceptions propagate to the caller. Returns false if a threaded
    // invocation was dropped.
    bool dispatch(DispatchMode mode, std::function<void()> invocation);

    void shutdown() { m_pool.shutdown(); }
    WorkerPool& pool() { return m_pool; }

private:
    WorkerPool m_pool;
};

} // namespace rpireactor
