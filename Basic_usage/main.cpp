/**
 * @file main.cpp
 * @brief Example application: GPIO interrupts and a TCP echo server on one Reactor.
 */

#include <iostream>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <chrono>
#include "Bcm2835GpioDriver.hpp"
#include "Errors.hpp"
#include "LockFreeRingBuffer.hpp"
#include "Log.hpp"
#include "NullGpioDriver.hpp"
#include "Reactor.hpp"

using namespace rpireactor;

struct PinEvent {
    int gpio;
    int value;
    uint64_t timestamp_ns;
};

// ============================================================================
// GLOBAL STATE & SIGNAL HANDLING
// ============================================================================

// Filled by the reactor thread, drained by main()
LockFreeRingBuffer<PinEvent, 1024> g_event_buffer;
std::atomic<uint32_t> g_dropped{0};

std::atomic<bool> g_keep_running{true};

void signal_handler([[maybe_unused]] int signum) {
    g_keep_running = false;
}

// ============================================================================
// MAIN APPLICATION
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);

    const int port = argc > 1 ? std::atoi(argv[1]) : 8080;

    // Fall back to a no-op driver when /dev/gpiomem is not accessible
    Bcm2835GpioDriver bcm_driver;
    NullGpioDriver null_driver;
    GpioDriver* driver = &bcm_driver;
    if (!bcm_driver.open()) {
        std::cerr << ANSI_YELLOW << "[Main] /dev/gpiomem not available, pull resistors are not configured."
                  << ANSI_RESET << "\n";
        driver = &null_driver;
    }

    Reactor reactor(*driver);

    // Runs on the reactor thread (Sync). Keep it short: no I/O here.
    auto on_edge = [](int gpio, int value) {
        auto now = std::chrono::steady_clock::now().time_since_epoch();
        PinEvent event{gpio, value,
                       static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count())};
        if (!g_event_buffer.push(event)) {
            g_dropped.fetch_add(1, std::memory_order_relaxed);
        }
    };

    // Runs on the worker pool, so a slow client never delays pin events
    auto on_message = [&reactor](TcpConnection connection, const std::string& message) {
        if (message == "quit") {
            connection.send("bye\n");
            connection.close();
            return;
        }
        if (message == "stop") {
            connection.send("stopping reactor\n");
            g_keep_running = false;
            return;
        }
        connection.send("echo: " + message + "\n");
    };

    try {
        reactor.register_interrupt(17, on_edge, Edge::Both, Pull::Up, 50);
        reactor.register_interrupt(27, on_edge, Edge::Rising, Pull::Down);
        int bound = reactor.register_tcp_listener(port, on_message, DispatchMode::Threaded);
        std::cout << "[Main] TCP echo server listening on port " << bound << "\n";
    } catch (const RpiReactorError& e) {
        std::cerr << ANSI_RED << "[Main] Setup failed: " << e.what() << ANSI_RESET << "\n";
        reactor.cleanup();
        return 1;
    }

    if (!reactor.start(std::chrono::milliseconds(100))) {
        std::cerr << "[Main] Failed to start the reactor loop.\n";
        return 1;
    }

    std::cout << "[Main] Watching GPIO 17 (both edges, 50 ms debounce) and GPIO 27 (rising). Press Ctrl+C to stop.\n";
    std::cout << "--------------------------------------------------------------\n";
    std::cout << "GPIO\tVALUE\tTIMESTAMP (ns)\n";
    std::cout << "--------------------------------------------------------------\n";

    PinEvent received_event;
    while (g_keep_running) {
        if (g_event_buffer.pop(received_event)) {
            std::cout << received_event.gpio << "\t" << received_event.value << "\t"
                      << received_event.timestamp_ns << "\n";
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    std::cout << "\n[Main] Shutdown signal received. Exiting safely...\n";
    reactor.stop();
    int rc = 0;
    try {
        reactor.join();
    } catch (const std::exception& e) {
        std::cerr << ANSI_RED << "[Main] Reactor stopped with error: " << e.what() << ANSI_RESET << "\n";
        rc = 1;
    }
    reactor.cleanup();

    if (g_dropped.load() > 0) {
        std::cout << "[Main] " << g_dropped.load() << " events dropped (buffer full).\n";
    }
    std::cout << "[Main] Application terminated successfully.\n";
    return rc;
}
