/**
 * @file TcpReactorTest.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief TCP listeners and clients served by a running Reactor over loopback.
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

#include "Errors.hpp"
#include "NullGpioDriver.hpp"
#include "Reactor.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cstring>

using namespace rpireactor;
using namespace rpireactor::test;
using std::chrono::milliseconds;

namespace {

// Blocking loopback client with a receive timeout
class Client {
public:
    explicit Client(int port) {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        struct timeval tv;
        tv.tv_sec = 2;
        tv.tv_usec = 0;
        ::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        m_connected = ::connect(m_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~Client() {
        if (m_fd >= 0) ::close(m_fd);
    }

    bool connected() const { return m_connected; }

    void send(const std::string& text) {
        ASSERT_EQ(static_cast<ssize_t>(text.size()), ::send(m_fd, text.data(), text.size(), MSG_NOSIGNAL));
    }

    // Reads until a newline. Empty string on EOF or timeout.
    std::string read_line() {
        std::string line;
        char c;
        while (true) {
            ssize_t n = ::recv(m_fd, &c, 1, 0);
            if (n <= 0) return line.empty() ? "" : line;
            if (c == '\n') return line;
            line += c;
        }
    }

    // True if the server closed the connection (recv returns 0).
    bool closed_by_peer() {
        char c;
        return ::recv(m_fd, &c, 1, 0) == 0;
    }

private:
    int m_fd = -1;
    bool m_connected = false;
};

class TcpReactorTest : public ::testing::Test {
protected:
    TempDir dir;
    NullGpioDriver driver;
    std::unique_ptr<Reactor> reactor;

    void SetUp() override {
        ReactorConfig config;
        config.board_revision = BoardRevision::Rev3;
        reactor = std::make_unique<Reactor>(driver, std::make_unique<FakeSysfsGpio>(dir.path()), config);
    }

    void TearDown() override {
        reactor->stop();
        try {
            reactor->join();
        } catch (const RpiReactorError& e) {
            ADD_FAILURE() << "reactor loop failed: " << e.what();
        }
        reactor.reset();
    }

    int start_echo_server(DispatchMode mode = DispatchMode::Sync) {
        int port = reactor->register_tcp_listener(0, [](TcpConnection connection, const std::string& message) {
            if (message == "quit") {
                connection.close();
                return;
            }
            connection.send("echo:" + message + "\n");
        }, mode);
        EXPECT_TRUE(reactor->start(milliseconds(100)));
        return port;
    }
};

} // namespace

TEST_F(TcpReactorTest, EchoesTrimmedPayload) {
    int port = start_echo_server();
    ASSERT_GT(port, 0);

    Client client(port);
    ASSERT_TRUE(client.connected());
    client.send("hello\n");
    EXPECT_EQ("echo:hello", client.read_line());
    client.send("   spaced out \r\n");
    EXPECT_EQ("echo:spaced out", client.read_line());
}

TEST_F(TcpReactorTest, EmptyLineClosesOnlyThatClient) {
    int port = start_echo_server();

    Client a(port);
    Client b(port);
    a.send("a\n");
    ASSERT_EQ("echo:a", a.read_line());
    b.send("b\n");
    ASSERT_EQ("echo:b", b.read_line());
    ASSERT_TRUE(wait_until([this] { return reactor->client_count() == 2; }));

    a.send("\n");
    EXPECT_TRUE(a.closed_by_peer());
    EXPECT_TRUE(wait_until([this] { return reactor->client_count() == 1; }));

    b.send("still here\n");
    EXPECT_EQ("echo:still here", b.read_line());
    EXPECT_EQ(1u, reactor->listener_count());

    Client c(port);
    c.send("new\n");
    EXPECT_EQ("echo:new", c.read_line());
}

TEST_F(TcpReactorTest, CallbackCanCloseConnection) {
    int port = start_echo_server();

    Client client(port);
    client.send("quit\n");
    EXPECT_TRUE(client.closed_by_peer());
    EXPECT_TRUE(wait_until([this] { return reactor->client_count() == 0; }));
}

TEST_F(TcpReactorTest, ClientDisconnectIsCleanedUp) {
    int port = start_echo_server();
    {
        Client client(port);
        client.send("x\n");
        ASSERT_EQ("echo:x", client.read_line());
        ASSERT_TRUE(wait_until([this] { return reactor->client_count() == 1; }));
    }
    EXPECT_TRUE(wait_until([this] { return reactor->client_count() == 0; }));
}

TEST_F(TcpReactorTest, ThreadedCallbacksReply) {
    int port = start_echo_server(DispatchMode::Threaded);

    Client client(port);
    client.send("ping\n");
    EXPECT_EQ("echo:ping", client.read_line());
}

TEST_F(TcpReactorTest, ListenerRegisteredWhileRunning) {
    ASSERT_TRUE(reactor->start(milliseconds(1000)));
    int port = reactor->register_tcp_listener(0, [](TcpConnection connection, const std::string& message) {
        connection.send(message + "!\n");
    });

    Client client(port);
    client.send("late\n");
    EXPECT_EQ("late!", client.read_line());
}

TEST_F(TcpReactorTest, InvalidListenerArguments) {
    EXPECT_THROW(reactor->register_tcp_listener(-1, [](TcpConnection, const std::string&) {}),
                 ConfigurationError);
    EXPECT_THROW(reactor->register_tcp_listener(70000, [](TcpConnection, const std::string&) {}),
                 ConfigurationError);
    EXPECT_THROW(reactor->register_tcp_listener(0, nullptr), ConfigurationError);
    EXPECT_EQ(0u, reactor->listener_count());
}

TEST_F(TcpReactorTest, PortInUseIsResourceError) {
    int port = reactor->register_tcp_listener(0, [](TcpConnection, const std::string&) {});
    try {
        reactor->register_tcp_listener(port, [](TcpConnection, const std::string&) {});
        FAIL() << "second bind succeeded";
    } catch (const ResourceError& e) {
        EXPECT_EQ(EADDRINUSE, e.code().value());
    }
    EXPECT_EQ(1u, reactor->listener_count());
}

TEST_F(TcpReactorTest, SyncCallbackFailureEndsLoop) {
    int port = reactor->register_tcp_listener(0, [](TcpConnection, const std::string& message) {
        throw std::runtime_error("cannot handle " + message);
    });
    ASSERT_TRUE(reactor->start(milliseconds(100)));

    Client client(port);
    client.send("boom\n");
    ASSERT_TRUE(wait_until([this] { return !reactor->is_running(); }));
    EXPECT_THROW(reactor->join(), RuntimeFault);

    // cleanup() stays usable after a fault
    EXPECT_NO_THROW(reactor->cleanup());
    EXPECT_EQ(0u, reactor->listener_count());
    EXPECT_NO_THROW(reactor->cleanup());
}

TEST_F(TcpReactorTest, CleanupClosesSockets) {
    int port = start_echo_server();

    Client client(port);
    client.send("hi\n");
    ASSERT_EQ("echo:hi", client.read_line());

    reactor->cleanup();
    EXPECT_EQ(0u, reactor->listener_count());
    EXPECT_EQ(0u, reactor->client_count());
    EXPECT_TRUE(client.closed_by_peer());
}
