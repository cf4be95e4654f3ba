/**
 * @file cps_monitor.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Real-time CPS monitor for edges accepted by the Reactor on one GPIO.
 * @requirements RpiReactor library, sysfs GPIO interface, write access to /sys/class/gpio.
 * * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 */

#include <iostream>
#include <atomic>
#include <chrono>
#include <thread>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include "Errors.hpp"
#include "Log.hpp"
#include "NullGpioDriver.hpp"
#include "Reactor.hpp"

#define CLEAR_SCREEN "\033[2J\033[H"
#define CLEAR_LINE   "\033[K"
#define HIDE_CURSOR  "\033[?25l"
#define SHOW_CURSOR  "\033[?25h"

using namespace rpireactor;

std::atomic<bool> g_keep_running{true};

// Written by the reactor thread on every accepted edge
std::atomic<uint64_t> g_latest_timestamp_ns{0};
std::atomic<uint32_t> g_event_counter{0};

void signal_handler(int signum) {
    (void)signum;
    g_keep_running.store(false, std::memory_order_release);
}

void print_banner(int gpio, const std::string& edge) {
    std::cout << CLEAR_SCREEN;
    std::cout << ANSI_CYAN << ANSI_BOLD;
    std::cout << "  _____  _____  _____   __  __             _ _             \n";
    std::cout << " / ____|  __ \\/ ____| |  \\/  |           (_) |            \n";
    std::cout << "| |    | |__) | (___  | \\  / | ___  _ __  _| |_ ___  _ __ \n";
    std::cout << "| |    |  ___/ \\___ \\ | |\\/| |/ _ \\| '_ \\| | __/ _ \\| '__|\n";
    std::cout << "| |____| |     ____) || |  | | (_) | | | | | || (_) | |   \n";
    std::cout << " \\_____|_|    |_____/ |_|  |_|\\___/|_| |_|_|\\__\\___/|_|   \n";
    std::cout << ANSI_RESET << "\n";
    std::cout << "===========================================================\n";
    std::cout << " Listening on GPIO " << gpio << " (" << edge << ") | Press Ctrl+C to stop\n";
    std::cout << "===========================================================\n\n";
}

uint64_t now_ns() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

int main(int argc, char* argv[]) {
    const int gpio = argc > 1 ? std::atoi(argv[1]) : 17;
    const std::string edge_name = argc > 2 ? argv[2] : "rising";
    const int debounce_ms = argc > 3 ? std::atoi(argv[3]) : 0;

    std::signal(SIGINT, signal_handler);

    // Pin pull resistors are left as they are; only the sysfs edge interface is used
    NullGpioDriver driver;
    Reactor reactor(driver);

    auto on_edge = [](int, int) {
        g_latest_timestamp_ns.store(now_ns(), std::memory_order_relaxed);
        g_event_counter.fetch_add(1, std::memory_order_relaxed);
    };

    try {
        reactor.register_interrupt(gpio, on_edge, parse_edge(edge_name), Pull::Off, debounce_ms);
    } catch (const RpiReactorError& e) {
        std::cerr << ANSI_RED << "[Error] " << e.what() << ANSI_RESET << "\n";
        return 1;
    }

    if (!reactor.start(std::chrono::milliseconds(100))) {
        std::cerr << ANSI_RED << "[Error] Failed to start the reactor loop." << ANSI_RESET << "\n";
        return 1;
    }

    std::cout << HIDE_CURSOR;
    print_banner(gpio, edge_name);

    uint64_t prev_ts = now_ns();
    uint32_t prev_counter = g_event_counter.load(std::memory_order_relaxed);

    auto next_tick = std::chrono::steady_clock::now() + std::chrono::seconds(1);

    while (g_keep_running.load(std::memory_order_acquire)) {
        std::this_thread::sleep_until(next_tick);
        if (!g_keep_running.load(std::memory_order_acquire)) break;

        uint64_t curr_ts = now_ns();
        uint32_t curr_counter = g_event_counter.load(std::memory_order_relaxed);

        uint32_t delta_events = curr_counter - prev_counter;
        double dt_sec = (curr_ts - prev_ts) / 1e9;
        uint32_t current_cps = dt_sec > 0 ? static_cast<uint32_t>((delta_events / dt_sec) + 0.5) : 0;

        prev_ts = curr_ts;
        prev_counter = curr_counter;

        const char* color_code = ANSI_GREEN;
        if (current_cps > 5000) color_code = ANSI_RED;
        else if (current_cps > 1000) color_code = ANSI_YELLOW;

        std::cout << "\r" << CLEAR_LINE
                  << ANSI_BOLD << " Live Rate: " << color_code << std::setw(8) << current_cps
                  << ANSI_RESET << " cps"
                  << " | Total: " << curr_counter
                  << std::flush;

        next_tick += std::chrono::seconds(1);
    }

    reactor.stop();
    int rc = 0;
    try {
        reactor.join();
    } catch (const std::exception& e) {
        std::cerr << "\n" << ANSI_RED << "[Error] " << e.what() << ANSI_RESET << "\n";
        rc = 1;
    }
    reactor.cleanup();

    std::cout << "\n\n" << ANSI_YELLOW << "[System] Monitor stopped cleanly." << ANSI_RESET << "\n";
    std::cout << SHOW_CURSOR;

    return rc;
}
