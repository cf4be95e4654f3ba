/**
 * @file WorkerPool.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Implementation of the bounded worker pool used for threaded callbacks.
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

#include "WorkerPool.hpp"
#include "Log.hpp"
#include <exception>

namespace rpireactor {

WorkerPool::WorkerPool(size_t num_threads, size_t queue_capacity)
    : m_num_threads(num_threads == 0 ? 1 : num_threads),
      m_capacity(queue_capacity == 0 ? 1 : queue_capacity),
      m_running(false),
      m_dropped(0) {
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.size() >= m_capacity) {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        // Threads are only spawned once somebody actually asks for one
        if (!m_running) {
            m_running = true;
            m_workers.reserve(m_num_threads);
            for (size_t i = 0; i < m_num_threads; ++i) {
                m_workers.emplace_back(&WorkerPool::worker_thread_func, this);
            }
        }
        m_queue.push_back(std::move(task));
    }
    m_cv.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
        m_queue.clear();
        workers.swap(m_workers);
    }
    m_cv.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        } else if (worker.joinable()) {
            // shutdown() called from one of our own tasks
            worker.detach();
        }
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void WorkerPool::worker_thread_func() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_running || !m_queue.empty(); });
            if (!m_running) return;
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            log(LogLevel::Error, "WorkerPool") << "Threaded callback failed: " << e.what();
        } catch (...) {
            log(LogLevel::Error, "WorkerPool") << "Threaded callback failed: unknown exception";
        }

        // A pool shut down while this task ran has already let go of us
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
    }
}

} // namespace rpireactor
