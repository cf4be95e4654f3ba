/**
 * @file Log.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Implementation of the tagged console logger.
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

#include "Log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace rpireactor {

namespace {
std::atomic<LogLevel> g_log_level{LogLevel::Info};
std::mutex g_log_mutex;
}

void set_log_level(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

LogLine::LogLine(LogLevel level, const char* tag)
    : m_level(level), m_tag(tag), m_enabled(level >= log_level() && level != LogLevel::Off) {
}

LogLine::~LogLine() {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    switch (m_level) {
    case LogLevel::Error:
        std::cerr << ANSI_RED << "[" << m_tag << "] " << m_stream.str() << ANSI_RESET << "\n";
        break;
    case LogLevel::Warning:
        std::cerr << ANSI_YELLOW << "[" << m_tag << "] Warning: " << m_stream.str() << ANSI_RESET << "\n";
        break;
    case LogLevel::Debug:
        std::cerr << "[" << m_tag << "] " << m_stream.str() << "\n";
        break;
    default:
        std::cout << "[" << m_tag << "] " << m_stream.str() << "\n";
        break;
    }
}

} // namespace rpireactor
