/**
 * @file TcpRegistry.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Socket setup, accept and close for the reactor's TCP surface.
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

#include "TcpRegistry.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "Reactor.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace rpireactor {

namespace {

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw ResourceError("Failed to make socket non-blocking", errno);
    }
}

} // namespace

bool TcpConnection::send(const std::string& text) const {
    return m_reactor != nullptr && m_reactor->send_tcp(*this, text);
}

void TcpConnection::close() const {
    if (m_reactor != nullptr) m_reactor->close_tcp_client(*this);
}

TcpRegistry::TcpRegistry(int backlog)
    : m_backlog(backlog), m_next_id(1) {
}

TcpRegistry::~TcpRegistry() {
    close_all();
}

int TcpRegistry::add_listener(int port, TcpCallback callback, DispatchMode mode) {
    if (!callback) {
        throw ConfigurationError("No callback");
    }
    if (port < 0 || port > 65535) {
        throw ConfigurationError("Invalid TCP port " + std::to_string(port));
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw ResourceError("Failed to create socket", errno);
    }

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        throw ResourceError("Failed to bind port " + std::to_string(port), err);
    }
    if (::listen(fd, m_backlog) < 0) {
        int err = errno;
        ::close(fd);
        throw ResourceError("Failed to listen on port " + std::to_string(port), err);
    }

    try {
        set_nonblocking(fd);
    } catch (const ResourceError&) {
        ::close(fd);
        throw;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port = ntohs(addr.sin_port);
    }

    m_listeners[fd] = Listener{fd, port, std::move(callback), mode};
    log(LogLevel::Debug, "TcpRegistry") << "Socket server started at port " << port << " and callback added";
    return port;
}

const TcpRegistry::Client* TcpRegistry::accept(int listener_fd) {
    auto it = m_listeners.find(listener_fd);
    if (it == m_listeners.end()) return nullptr;

    int fd = ::accept4(listener_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED) {
            return nullptr;
        }
        throw ResourceError("accept() failed on port " + std::to_string(it->second.port), errno);
    }

    Client client{fd, listener_fd, m_next_id++, it->second.callback, it->second.mode};
    auto inserted = m_clients.insert_or_assign(fd, std::move(client));
    log(LogLevel::Debug, "TcpRegistry") << "- client fd " << fd << " connected to port " << it->second.port;
    return &inserted.first->second;
}

const TcpRegistry::Listener* TcpRegistry::listener(int fd) const {
    auto it = m_listeners.find(fd);
    return it == m_listeners.end() ? nullptr : &it->second;
}

const TcpRegistry::Client* TcpRegistry::client(int fd) const {
    auto it = m_clients.find(fd);
    return it == m_clients.end() ? nullptr : &it->second;
}

bool TcpRegistry::close_client(int fd, uint64_t id) {
    auto it = m_clients.find(fd);
    if (it == m_clients.end() || it->second.id != id) return false;
    close_client(fd);
    return true;
}

void TcpRegistry::close_client(int fd) {
    auto it = m_clients.find(fd);
    if (it == m_clients.end()) return;

    log(LogLevel::Debug, "TcpRegistry") << "closing client socket fd " << fd;
    ::close(fd);
    m_clients.erase(it);
}

void TcpRegistry::close_all() {
    for (auto& entry : m_clients) {
        ::close(entry.first);
    }
    m_clients.clear();

    for (auto& entry : m_listeners) {
        log(LogLevel::Debug, "TcpRegistry") << "- closing server socket (fd " << entry.first << ", port "
                                            << entry.second.port << ")";
        ::close(entry.first);
    }
    m_listeners.clear();
}

std::vector<int> TcpRegistry::listener_fds() const {
    std::vector<int> fds;
    for (const auto& entry : m_listeners) fds.push_back(entry.first);
    return fds;
}

std::vector<int> TcpRegistry::client_fds() const {
    std::vector<int> fds;
    for (const auto& entry : m_clients) fds.push_back(entry.first);
    return fds;
}

} // namespace rpireactor
