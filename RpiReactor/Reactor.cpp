/**
 * @file Reactor.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Implementation of the GPIO/TCP readiness loop.
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

#include "Reactor.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <fcntl.h>
#include <poll.h>       // For poll()
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <optional>

namespace rpireactor {

namespace {

BoardRevision resolve_revision(BoardRevision configured) {
    if (configured != BoardRevision::Unknown) return configured;

    BoardRevision detected = detect_board_revision();
    if (detected == BoardRevision::Unknown) {
        log(LogLevel::Warning, "Reactor") << "Board revision unknown, assuming 40-pin header (rev3)";
        return BoardRevision::Rev3;
    }
    return detected;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

const char* to_string(Reactor::State state) {
    switch (state) {
    case Reactor::State::Idle: return "idle";
    case Reactor::State::Running: return "running";
    case Reactor::State::Stopping: return "stopping";
    }
    return "?";
}

Reactor::Reactor(GpioDriver& driver, ReactorConfig config)
    : Reactor(driver, std::make_unique<SysfsGpio>(config.sysfs_root, config.settle_time), config) {
}

Reactor::Reactor(GpioDriver& driver, std::unique_ptr<SysfsGpio> sysfs, ReactorConfig config)
    : m_config(std::move(config)),
      m_revision(resolve_revision(m_config.board_revision)),
      m_sysfs(std::move(sysfs)),
      m_interrupts(driver, *m_sysfs, m_revision),
      m_tcp(m_config.tcp_backlog),
      m_dispatcher(m_config.worker_threads, m_config.worker_queue_capacity),
      m_state(State::Idle),
      m_stop_requested(false) {
    if (::pipe2(m_wake_pipe, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw ResourceError("Failed to create wake pipe", errno);
    }
}

Reactor::~Reactor() {
    stop();
    if (m_loop_thread.joinable()) {
        m_loop_thread.join();
    }
    // Workers may still register pins; they must be done before cleanup()
    m_dispatcher.shutdown();
    cleanup();

    ::close(m_wake_pipe[0]);
    ::close(m_wake_pipe[1]);
}

int Reactor::register_interrupt(int pin, InterruptCallback callback, Edge edge, Pull pull,
                                int debounce_ms, DispatchMode mode) {
    int fd;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        fd = m_interrupts.add(pin, std::move(callback), edge, pull, debounce_ms, mode);
    }
    wake();
    return fd;
}

void Reactor::unregister_interrupt(int pin) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interrupts.remove(pin);
    }
    wake();
}

int Reactor::register_tcp_listener(int port, TcpCallback callback, DispatchMode mode) {
    int bound;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        bound = m_tcp.add_listener(port, std::move(callback), mode);
    }
    wake();
    return bound;
}

void Reactor::run(std::chrono::milliseconds poll_timeout) {
    // Cleared before the state change so a stop() issued right after it is kept
    m_stop_requested = false;
    State expected = State::Idle;
    if (!m_state.compare_exchange_strong(expected, State::Running)) {
        throw ConflictError("Reactor loop is already running");
    }
    run_loop(poll_timeout);
}

bool Reactor::start(std::chrono::milliseconds poll_timeout) {
    m_stop_requested = false;
    State expected = State::Idle;
    if (!m_state.compare_exchange_strong(expected, State::Running)) {
        log(LogLevel::Error, "Reactor") << "Already running.";
        return false;
    }

    // A previous detached loop has finished; reap it before reusing the slot
    if (m_loop_thread.joinable()) {
        m_loop_thread.join();
    }
    if (m_fault) {
        try {
            std::rethrow_exception(m_fault);
        } catch (const std::exception& e) {
            log(LogLevel::Warning, "Reactor") << "Discarding unjoined fault of previous loop: " << e.what();
        }
        m_fault = nullptr;
    }

    m_loop_thread = std::thread([this, poll_timeout]() {
        try {
            run_loop(poll_timeout);
        } catch (const std::exception& e) {
            log(LogLevel::Error, "Reactor") << "Loop terminated: " << e.what();
            m_fault = std::current_exception();
        } catch (...) {
            log(LogLevel::Error, "Reactor") << "Loop terminated: unknown exception";
            m_fault = std::make_exception_ptr(RuntimeFault("unknown exception"));
        }
    });
    return true;
}

void Reactor::join() {
    if (m_loop_thread.joinable() && m_loop_thread.get_id() != std::this_thread::get_id()) {
        m_loop_thread.join();
    }
    if (m_fault) {
        std::exception_ptr fault = m_fault;
        m_fault = nullptr;
        std::rethrow_exception(fault);
    }
}

void Reactor::stop() {
    m_stop_requested = true;
    State expected = State::Running;
    m_state.compare_exchange_strong(expected, State::Stopping);
    wake();
}

void Reactor::cleanup() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        log(LogLevel::Debug, "Reactor") << "Cleaning up interfaces...";
        m_tcp.close_all();
        m_interrupts.clear();
        m_sysfs->unexport_all();
    }
    wake();
}

void Reactor::run_loop(std::chrono::milliseconds poll_timeout) {
    const int timeout_ms = static_cast<int>(poll_timeout.count());
    std::vector<struct pollfd> pfds;
    std::vector<SourceKind> kinds;

    try {
        while (!m_stop_requested.load() && m_state.load() == State::Running) {
            pfds.clear();
            kinds.clear();
            pfds.push_back({m_wake_pipe[0], POLLIN, 0});
            kinds.push_back(SourceKind::Wake);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (int fd : m_tcp.listener_fds()) {
                    pfds.push_back({fd, POLLIN, 0});
                    kinds.push_back(SourceKind::Listener);
                }
                for (int fd : m_tcp.client_fds()) {
                    pfds.push_back({fd, POLLIN, 0});
                    kinds.push_back(SourceKind::Client);
                }
                for (int fd : m_interrupts.value_fds()) {
                    pfds.push_back({fd, POLLPRI | POLLERR, 0});
                    kinds.push_back(SourceKind::Pin);
                }
            }

            // Block until an event arrives or the timeout lets us re-check the stop flag
            int ret = ::poll(pfds.data(), pfds.size(), timeout_ms);
            if (ret < 0) {
                if (errno == EINTR) continue;
                throw ResourceError("poll() error", errno);
            }
            if (ret == 0) continue;

            for (size_t i = 0; i < pfds.size(); ++i) {
                const short revents = pfds[i].revents;
                if (revents == 0) continue;
                log(LogLevel::Debug, "Reactor") << "- poll event on fd " << pfds[i].fd << ": " << revents;

                switch (kinds[i]) {
                case SourceKind::Wake:
                    drain_wake_pipe();
                    break;
                case SourceKind::Listener:
                    handle_listener(pfds[i].fd);
                    break;
                case SourceKind::Client:
                    handle_client(pfds[i].fd, revents);
                    break;
                case SourceKind::Pin:
                    if (revents & (POLLPRI | POLLERR)) handle_pin(pfds[i].fd);
                    break;
                }
            }
        }
    } catch (const ResourceError& e) {
        log(LogLevel::Error, "Reactor") << e.what() << ", auto-cleaning interfaces";
        cleanup_best_effort();
        m_state = State::Idle;
        throw;
    } catch (...) {
        m_state = State::Idle;
        throw;
    }

    m_state = State::Idle;
    log(LogLevel::Debug, "Reactor") << "Loop stopped";
}

void Reactor::handle_listener(int fd) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // The listener may have been closed by cleanup() since poll() returned
    if (m_tcp.listener(fd) == nullptr) return;
    m_tcp.accept(fd);
}

void Reactor::handle_client(int fd, short revents) {
    TcpCallback callback;
    DispatchMode mode;
    uint64_t id;
    std::string payload;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const TcpRegistry::Client* client = m_tcp.client(fd);
        if (client == nullptr) return;

        if (!(revents & POLLIN)) {
            // Hangup or error without pending data
            m_tcp.close_client(fd);
            return;
        }

        std::vector<char> buf(m_config.tcp_read_size);
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return;
            log(LogLevel::Warning, "Reactor") << "recv() on client fd " << fd << " failed: " << std::strerror(errno);
            m_tcp.close_client(fd);
            return;
        }

        payload = trim(std::string(buf.data(), static_cast<size_t>(n)));
        if (payload.empty()) {
            // No content means the client is done
            m_tcp.close_client(fd);
            return;
        }

        callback = client->callback;
        mode = client->mode;
        id = client->id;
    }

    TcpConnection connection(this, fd, id);
    invoke(mode, [callback, connection, payload]() { callback(connection, payload); });
}

void Reactor::handle_pin(int fd) {
    int pin;
    int value;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::optional<int> found = m_interrupts.pin_for_fd(fd);
        if (!found) return;
        pin = *found;
        value = m_sysfs->sample(fd);
    }
    handle_interrupt(pin, value, Clock::now());
}

void Reactor::handle_interrupt(int pin, int value, Clock::time_point now) {
    std::vector<InterruptSubscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        subscribers = m_interrupts.accept(pin, value, now);
    }

    for (auto& subscriber : subscribers) {
        InterruptCallback callback = subscriber.callback;
        invoke(subscriber.mode, [callback, pin, value]() { callback(pin, value); });
    }
}

bool Reactor::send_tcp(const TcpConnection& connection, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const TcpRegistry::Client* client = m_tcp.client(connection.fd());
    if (client == nullptr || client->id != connection.id()) return false;

    size_t sent = 0;
    while (sent < text.size()) {
        ssize_t n = ::send(connection.fd(), text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            log(LogLevel::Warning, "Reactor") << "send() to client fd " << connection.fd() << " failed: "
                                              << std::strerror(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void Reactor::close_tcp_client(const TcpConnection& connection) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tcp.close_client(connection.fd(), connection.id());
    }
    wake();
}

void Reactor::invoke(DispatchMode mode, std::function<void()> invocation) {
    try {
        m_dispatcher.dispatch(mode, std::move(invocation));
    } catch (const std::exception& e) {
        throw RuntimeFault(std::string("Callback raised an exception: ") + e.what());
    } catch (...) {
        throw RuntimeFault("Callback raised an unknown exception");
    }
}

void Reactor::cleanup_best_effort() {
    try {
        cleanup();
    } catch (const std::exception& e) {
        log(LogLevel::Error, "Reactor") << "Cleanup after fault failed: " << e.what();
    }
}

void Reactor::wake() {
    const char byte = 1;
    if (::write(m_wake_pipe[1], &byte, 1) < 0 && errno != EAGAIN) {
        log(LogLevel::Warning, "Reactor") << "Failed to wake loop: " << std::strerror(errno);
    }
}

void Reactor::drain_wake_pipe() {
    char buf[64];
    while (::read(m_wake_pipe[0], buf, sizeof(buf)) > 0) {
    }
}

std::vector<int> Reactor::interrupt_pins() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_interrupts.pins();
}

size_t Reactor::callback_count(int pin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_interrupts.callback_count(pin);
}

std::set<int> Reactor::exported_pins() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sysfs->exported_pins();
}

size_t Reactor::listener_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tcp.listener_count();
}

size_t Reactor::client_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tcp.client_count();
}

} // namespace rpireactor
