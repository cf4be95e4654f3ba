/**
 * @file LockFreeRingBuffer.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Single-producer single-consumer ring buffer for handing events out of a callback.
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
#include <cstddef>

namespace rpireactor {

// Lets a Sync callback on the reactor thread pass data to another thread
// without taking a lock. Exactly one producer and one consumer.
template <typename T, size_t Size>
class LockFreeRingBuffer {
private:
    T m_data[Size];
    std::atomic<size_t> m_head{0}; // Written by the producer
    std::atomic<size_t> m_tail{0}; // Written by the consumer

public:
    // Returns false if full; the item is not stored.
    bool push(const T& item) {
        size_t current_head = m_head.load(std::memory_order_relaxed);

        if (current_head - m_tail.load(std::memory_order_acquire) >= Size) {
            return false;
        }

        m_data[current_head % Size] = item;

        // Publish the slot before advancing head
        m_head.store(current_head + 1, std::memory_order_release);
        return true;
    }

    // Returns false if empty.
    bool pop(T& item) {
        size_t current_tail = m_tail.load(std::memory_order_relaxed);

        if (current_tail == m_head.load(std::memory_order_acquire)) {
            return false;
        }

        item = m_data[current_tail % Size];

        m_tail.store(current_tail + 1, std::memory_order_release);
        return true;
    }
};

} // namespace rpireactor
