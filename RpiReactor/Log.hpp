/**
 * @file Log.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Tagged console logging ("[Reactor] ...") with a process-wide level.
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

#pragma once

#include <sstream>
#include <string>

#define ANSI_RESET   "\033[0m"
#define ANSI_BOLD    "\033[1m"
#define ANSI_CYAN    "\033[36m"
#define ANSI_GREEN   "\033[32m"
#define ANSI_YELLOW  "\033[33m"
#define ANSI_RED     "\033[31m"

namespace rpireactor {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

void set_log_level(LogLevel level);
LogLevel log_level();

// One log line. Collects the message and writes it on destruction, so that
// lines from the loop thread and the worker pool never interleave.
class LogLine {
public:
    LogLine(LogLevel level, const char* tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (m_enabled) m_stream << value;
        return *this;
    }

private:
    LogLevel m_level;
    const char* m_tag;
    bool m_enabled;
    std::ostringstream m_stream;
};

inline LogLine log(LogLevel level, const char* tag) {
    return LogLine(level, tag);
}

} // namespace rpireactor
