/**
 * @file cps_root.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Real-time CPS monitor with ROOT GUI for edges accepted by the Reactor.
 * @requirements RpiReactor library, sysfs GPIO interface, ROOT framework installed.
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
#include <algorithm>
#include <cstdlib>
#include <TApplication.h>
#include <TCanvas.h>
#include <TGraph.h>
#include <TAxis.h>
#include <TSystem.h>
#include <TMath.h>
#include <TString.h>
#include "Errors.hpp"
#include "NullGpioDriver.hpp"
#include "Reactor.hpp"

using namespace rpireactor;

std::atomic<bool> g_keep_running{true};

// Incremented by the reactor thread on every accepted edge
std::atomic<uint32_t> g_event_counter{0};

void signal_handler(int signum) {
    (void)signum;
    g_keep_running.store(false, std::memory_order_release);
}

int main(int argc, char** argv) {
    const int gpio = argc > 1 ? std::atoi(argv[1]) : 17;
    const int debounce_ms = argc > 2 ? std::atoi(argv[2]) : 0;

    std::signal(SIGINT, signal_handler);

    // Initialize ROOT application to handle GUI events
    TApplication app("CPS_ROOT_GUI", &argc, argv);

    // Setup Canvas
    auto canvas = new TCanvas("c_cps", "Real-Time CPS Monitor", 1000, 600);
    canvas->SetGrid();

    // Setup Graph with points connected by line segments (PL)
    auto graph = new TGraph();
    graph->SetTitle(Form("Live Counts Per Second (GPIO %d);Time (s);cps", gpio));
    graph->SetLineColor(kBlue);
    graph->SetLineWidth(2);
    graph->SetMarkerStyle(20);
    graph->SetMarkerSize(0.8);
    graph->SetMarkerColor(kRed);
    // Draw is deferred until the first point is added to avoid PaintGraph errors

    NullGpioDriver driver;
    Reactor reactor(driver);

    auto on_edge = [](int, int) {
        g_event_counter.fetch_add(1, std::memory_order_relaxed);
    };

    try {
        reactor.register_interrupt(gpio, on_edge, Edge::Rising, Pull::Off, debounce_ms);
    } catch (const RpiReactorError& e) {
        std::cerr << "[Error] " << e.what() << "\n";
        return 1;
    }

    if (!reactor.start(std::chrono::milliseconds(100))) {
        std::cerr << "[Error] Failed to start the reactor loop.\n";
        return 1;
    }

    std::cout << "[System] ROOT GUI started. Press Ctrl+C in terminal or close the window to exit.\n";

    auto prev_ts = std::chrono::steady_clock::now();
    uint32_t prev_counter = g_event_counter.load(std::memory_order_relaxed);

    int time_sec = 0;
    auto next_tick = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    bool first_draw = true;

    // Main GUI and Data Polling Loop
    while (g_keep_running.load(std::memory_order_acquire)) {
        // Process ROOT GUI events to keep window responsive
        gSystem->ProcessEvents();

        auto now = std::chrono::steady_clock::now();
        if (now >= next_tick) {
            uint32_t curr_counter = g_event_counter.load(std::memory_order_relaxed);

            double dt_sec = std::chrono::duration<double>(now - prev_ts).count();
            uint32_t delta_events = curr_counter - prev_counter;
            uint32_t current_cps = dt_sec > 0 ? static_cast<uint32_t>((delta_events / dt_sec) + 0.5) : 0;

            prev_ts = now;
            prev_counter = curr_counter;
            
            // Append point to the graph
            graph->SetPoint(graph->GetN(), time_sec, current_cps);
            time_sec++;

            // Rescale X axis to maintain a sliding 60-second window for real-time tracking
            graph->GetXaxis()->SetLimits(std::max(0, time_sec - 60), std::max(60, time_sec + 5));
            
            // Apply dynamic symmetric offset to Y axis
            if (graph->GetN() > 0) {
                double min_y = TMath::MinElement(graph->GetN(), graph->GetY());
                double max_y = TMath::MaxElement(graph->GetN(), graph->GetY());
                
                double offset = (max_y - min_y) * 0.1;
                if (offset == 0) offset = max_y * 0.1; 
                if (offset == 0) offset = 1.0; 
                
                graph->GetYaxis()->SetRangeUser(min_y - offset, max_y + offset);

                // Draw only after the first point is available
                if (first_draw) {
                    graph->Draw("APL");
                    first_draw = false;
                }
            }
            
            // Force redraw
            canvas->Modified();
            canvas->Update();

            next_tick += std::chrono::seconds(1);
        }

        // 20ms sleep to prevent the GUI polling loop from hogging the CPU core
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    reactor.stop();
    int rc = 0;
    try {
        reactor.join();
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << "\n";
        rc = 1;
    }
    reactor.cleanup();
    return rc;
}