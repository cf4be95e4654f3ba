/**
 * @file TcpRegistry.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Listening sockets and accepted clients served by the reactor.
 * @requirements C++17, Linux.
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

#include "CallbackDispatcher.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace rpireactor {

class Reactor;

// Handle to one accepted client, passed to TCP callbacks. Cheap to copy; it
// stays safe to use after the client is gone (send() then returns false).
class TcpConnection {
public:
    TcpConnection(Reactor* reactor, int fd, uint64_t id)
        : m_reactor(reactor), m_fd(fd), m_id(id) {}

    int fd() const { return m_fd; }
    uint64_t id() const { return m_id; }

    bool send(const std::string& text) const;
    void close() const;

private:
    Reactor* m_reactor;
    int m_fd;
    uint64_t m_id;
};

using TcpCallback = std::function<void(TcpConnection connection, const std::string& message)>;

/**
 * Not thread-safe; the Reactor holds its registry lock around every call.
 */
class TcpRegistry {
public:
    struct Listener {
        int fd;
        int port;
        TcpCallback callback;
        DispatchMode mode;
    };

    struct Client {
        int fd;
        int listener_fd;
        uint64_t id;
        TcpCallback callback;
        DispatchMode mode;
    };

    explicit TcpRegistry(int backlog = 8);
    ~TcpRegistry();

    TcpRegistry(const TcpRegistry&) = delete;
    TcpRegistry& operator=(const TcpRegistry&) = delete;

    // Binds 0.0.0.0:port (0 picks a free port) and returns the bound port.
    int add_listener(int port, TcpCallback callback, DispatchMode mode);

    // Accepts one pending connection. Returns the client, or nullptr if
    // nothing was pending.
    const Client* accept(int listener_fd);

    const Listener* listener(int fd) const;
    const Client* client(int fd) const;

    // Returns false if fd is not a client, or belongs to a newer connection
    // than the given id.
    bool close_client(int fd, uint64_t id);
    void close_client(int fd);
    void close_all();

    std::vector<int> listener_fds() const;
    std::vector<int> client_fds() const;
    size_t listener_count() const { return m_listeners.size(); }
    size_t client_count() const { return m_clients.size(); }

private:
    int m_backlog;
    uint64_t m_next_id;
    std::map<int, Listener> m_listeners;
    std::map<int, Client> m_clients;
};

} // namespace rpireactor
