/**
 * @file WorkerPool.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Fixed-size pool of worker threads fed by a bounded task queue.
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

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace rpireactor {

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t num_threads = 4, size_t queue_capacity = 256);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queues a task. Returns false when the queue is full; the task is
    // then dropped and counted in dropped().
    bool submit(Task task);

    // Discards queued tasks and joins the workers. Tasks already running
    // finish first. The pool restarts on the next submit().
    // Should not be called from one of the pool's own tasks; if it is, that
    // worker is detached and exits as soon as the task returns.
    void shutdown();

    size_t pending() const;
    size_t dropped() const { return m_dropped.load(std::memory_order_relaxed); }
    size_t capacity() const { return m_capacity; }
    size_t num_threads() const { return m_num_threads; }

private:
    size_t m_num_threads;
    size_t m_capacity;
    std::vector<std::thread> m_workers;
    std::deque<Task> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_running;
    std::atomic<size_t> m_dropped;

    void worker_thread_func();
};

} // namespace rpireactor
