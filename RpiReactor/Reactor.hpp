/**
 * @file Reactor.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Single poll() loop serving GPIO edge interrupts and TCP clients.
 * @requirements C++17, Linux with CONFIG_GPIO_SYSFS.
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

#include "Board.hpp"
#include "CallbackDispatcher.hpp"
#include "GpioDriver.hpp"
#include "InterruptRegistry.hpp"
#include "SysfsGpio.hpp"
#include "TcpRegistry.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace rpireactor {

struct ReactorConfig {
    std::string sysfs_root = "/sys/class/gpio";
    // Unknown means: read /proc/cpuinfo, fall back to Rev3 if that fails
    BoardRevision board_revision = BoardRevision::Unknown;
    std::chrono::milliseconds settle_time{100};
    size_t worker_threads = 4;
    size_t worker_queue_capacity = 256;
    int tcp_backlog = 8;
    size_t tcp_read_size = 1024;
};

/**
 * Owns the interrupt and TCP registries and the loop that serves them.
 *
 * Registry access is serialized by one mutex. Callbacks always run with the
 * mutex released, so a callback may register, unregister, close a client or
 * call stop(). Every mutation wakes the loop so the next poll() sees it.
 *
 * Sync callbacks block the loop for as long as they run. Use
 * DispatchMode::Threaded for anything slow.
 */
class Reactor {
public:
    using Clock = std::chrono::steady_clock;

    enum class State {
        Idle,
        Running,
        Stopping
    };

    explicit Reactor(GpioDriver& driver, ReactorConfig config = ReactorConfig());
    Reactor(GpioDriver& driver, std::unique_ptr<SysfsGpio> sysfs, ReactorConfig config = ReactorConfig());
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Returns the value fd of the pin's interrupt source.
    int register_interrupt(int pin, InterruptCallback callback, Edge edge = Edge::Both,
                           Pull pull = Pull::Off, int debounce_ms = 0,
                           DispatchMode mode = DispatchMode::Sync);
    void unregister_interrupt(int pin);

    // Returns the port actually bound (useful with port 0).
    int register_tcp_listener(int port, TcpCallback callback, DispatchMode mode = DispatchMode::Sync);

    // Blocks until stop(). Throws ConflictError if a loop is already active,
    // RuntimeFault if a sync callback threw, ResourceError on I/O failure
    // (after best-effort cleanup).
    void run(std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(1000));

    // Runs the loop on a background thread. Returns false if already running.
    bool start(std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(1000));

    // Waits for a loop started with start() and rethrows its fault, if any.
    void join();

    // Idempotent. The loop exits within one poll cycle.
    void stop();

    // Closes every socket and unexports every pin this reactor exported.
    // Safe to call repeatedly, after a fault, or while the loop runs.
    void cleanup();

    // Filter and dispatch one pin value, as the loop does on POLLPRI.
    void handle_interrupt(int pin, int value, Clock::time_point now = Clock::now());

    bool send_tcp(const TcpConnection& connection, const std::string& text);
    void close_tcp_client(const TcpConnection& connection);

    State state() const { return m_state.load(); }
    bool is_running() const { return m_state.load() != State::Idle; }
    BoardRevision board_revision() const { return m_revision; }

    std::vector<int> interrupt_pins() const;
    size_t callback_count(int pin) const;
    std::set<int> exported_pins() const;
    size_t listener_count() const;
    size_t client_count() const;
    WorkerPool& worker_pool() { return m_dispatcher.pool(); }

private:
    enum class SourceKind {
        Wake,
        Listener,
        Client,
        Pin
    };

    ReactorConfig m_config;
    BoardRevision m_revision;
    std::unique_ptr<SysfsGpio> m_sysfs;
    InterruptRegistry m_interrupts;
    TcpRegistry m_tcp;
    CallbackDispatcher m_dispatcher;

    mutable std::mutex m_mutex;
    std::atomic<State> m_state;
    std::atomic<bool> m_stop_requested;
    std::thread m_loop_thread;
    std::exception_ptr m_fault;
    int m_wake_pipe[2];

    void run_loop(std::chrono::milliseconds poll_timeout);
    void handle_listener(int fd);
    void handle_client(int fd, short revents);
    void handle_pin(int fd);
    void invoke(DispatchMode mode, std::function<void()> invocation);
    void cleanup_best_effort();
    void wake();
    void drain_wake_pipe();
};

const char* to_string(Reactor::State state);

} // namespace rpireactor
