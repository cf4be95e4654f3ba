/**
 * @file WorkerPoolTest.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Bounded worker pool: execution, backpressure and cancellation.
 * @requirements C++17, Linux, GoogleTest.
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
#include "TestSupport.hpp"
#include "WorkerPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <thread>

using namespace rpireactor;
using rpireactor::test::wait_until;

namespace {

// Occupies a worker until release() is called
class Gate {
public:
    WorkerPool::Task blocker() {
        return [this] {
            m_entered = true;
            m_future.wait();
        };
    }

    bool entered() const { return m_entered.load(); }
    void release() { m_promise.set_value(); }

private:
    std::promise<void> m_promise;
    std::shared_future<void> m_future{m_promise.get_future().share()};
    std::atomic<bool> m_entered{false};
};

} // namespace

TEST(WorkerPoolTest, RunsSubmittedTasks) {
    WorkerPool pool(4, 64);
    std::atomic<int> count{0};
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.submit([&count] { ++count; }));
    }
    EXPECT_TRUE(wait_until([&count] { return count.load() == 20; }));
    pool.shutdown();
}

TEST(WorkerPoolTest, FullQueueRejectsTasks) {
    WorkerPool pool(1, 2);
    Gate gate;
    std::atomic<int> count{0};

    ASSERT_TRUE(pool.submit(gate.blocker()));
    ASSERT_TRUE(wait_until([&gate] { return gate.entered(); }));

    EXPECT_TRUE(pool.submit([&count] { ++count; }));
    EXPECT_TRUE(pool.submit([&count] { ++count; }));
    EXPECT_FALSE(pool.submit([&count] { ++count; }));
    EXPECT_EQ(2u, pool.pending());
    EXPECT_EQ(1u, pool.dropped());

    gate.release();
    EXPECT_TRUE(wait_until([&count] { return count.load() == 2; }));
    pool.shutdown();
}

TEST(WorkerPoolTest, FailingTaskDoesNotKillWorker) {
    WorkerPool pool(1, 8);
    std::atomic<int> count{0};
    pool.submit([] { throw std::runtime_error("task failed"); });
    pool.submit([&count] { ++count; });
    EXPECT_TRUE(wait_until([&count] { return count.load() == 1; }));
    pool.shutdown();
}

TEST(WorkerPoolTest, NonStandardThrowDoesNotKillWorker) {
    WorkerPool pool(1, 8);
    std::atomic<int> count{0};
    pool.submit([] { throw 7; });
    pool.submit([&count] { ++count; });
    EXPECT_TRUE(wait_until([&count] { return count.load() == 1; }));
    pool.shutdown();
}

TEST(WorkerPoolTest, ShutdownDiscardsPendingTasks) {
    WorkerPool pool(1, 8);
    Gate gate;
    std::atomic<int> count{0};

    pool.submit(gate.blocker());
    ASSERT_TRUE(wait_until([&gate] { return gate.entered(); }));
    for (int i = 0; i < 3; ++i) pool.submit([&count] { ++count; });
    EXPECT_EQ(3u, pool.pending());

    std::thread stopper([&pool] { pool.shutdown(); });
    ASSERT_TRUE(wait_until([&pool] { return pool.pending() == 0; }));
    gate.release();
    stopper.join();

    EXPECT_EQ(0, count.load());
}

TEST(WorkerPoolTest, RestartsAfterShutdown) {
    WorkerPool pool(2, 8);
    pool.shutdown();
    std::atomic<int> count{0};
    ASSERT_TRUE(pool.submit([&count] { ++count; }));
    EXPECT_TRUE(wait_until([&count] { return count.load() == 1; }));
}

TEST(WorkerPoolTest, WorkerThatShutDownItsPoolExits) {
    WorkerPool pool(1, 16);
    std::mutex mutex;
    std::thread::id first_worker;
    std::atomic<bool> shut_down{false};

    pool.submit([&] {
        {
            std::lock_guard<std::mutex> lock(mutex);
            first_worker = std::this_thread::get_id();
        }
        pool.shutdown();
        shut_down = true;
    });
    ASSERT_TRUE(wait_until([&shut_down] { return shut_down.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::set<std::thread::id> later_workers;
    std::atomic<int> count{0};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.submit([&] {
            std::lock_guard<std::mutex> lock(mutex);
            later_workers.insert(std::this_thread::get_id());
            ++count;
        }));
    }
    ASSERT_TRUE(wait_until([&count] { return count.load() == 10; }));
    pool.shutdown();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(0u, later_workers.count(first_worker));
}

TEST(CallbackDispatcherTest, SyncRunsInlineAndPropagates) {
    CallbackDispatcher dispatcher(1, 1);
    std::thread::id ran_on;
    EXPECT_TRUE(dispatcher.dispatch(DispatchMode::Sync, [&ran_on] { ran_on = std::this_thread::get_id(); }));
    EXPECT_EQ(std::this_thread::get_id(), ran_on);
    EXPECT_THROW(dispatcher.dispatch(DispatchMode::Sync, [] { throw std::logic_error("x"); }), std::logic_error);
}

TEST(CallbackDispatcherTest, ThreadedReportsDroppedEvents) {
    CallbackDispatcher dispatcher(1, 1);
    Gate gate;

    ASSERT_TRUE(dispatcher.dispatch(DispatchMode::Threaded, gate.blocker()));
    ASSERT_TRUE(wait_until([&gate] { return gate.entered(); }));
    EXPECT_TRUE(dispatcher.dispatch(DispatchMode::Threaded, [] {}));
    EXPECT_FALSE(dispatcher.dispatch(DispatchMode::Threaded, [] {}));
    EXPECT_EQ(1u, dispatcher.pool().dropped());

    gate.release();
    dispatcher.shutdown();
}
