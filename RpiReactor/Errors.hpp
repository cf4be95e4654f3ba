/**
 * @file Errors.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Exception taxonomy shared by the reactor and the PWM scheduler.
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

#include <stdexcept>
#include <string>
#include <system_error>
#include <cerrno>

namespace rpireactor {

class RpiReactorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid pin, edge, pull, frequency or pulse width. Thrown before any state change.
class ConfigurationError : public RpiReactorError {
public:
    using RpiReactorError::RpiReactorError;
};

// Request incompatible with existing state (edge mismatch, subcycle mismatch).
class ConflictError : public RpiReactorError {
public:
    using RpiReactorError::RpiReactorError;
};

class NotFoundError : public RpiReactorError {
public:
    using RpiReactorError::RpiReactorError;
};

// I/O failure on sysfs files or sockets. Carries the errno that caused it.
class ResourceError : public RpiReactorError {
public:
    ResourceError(const std::string& what, int err)
        : RpiReactorError(what + ": " + std::system_category().message(err)),
          m_code(err, std::system_category()) {}

    explicit ResourceError(const std::string& what)
        : RpiReactorError(what), m_code() {}

    const std::error_code& code() const noexcept { return m_code; }

private:
    std::error_code m_code;
};

// A synchronous callback threw while the reactor loop was running.
class RuntimeFault : public RpiReactorError {
public:
    using RpiReactorError::RpiReactorError;
};

} // namespace rpireactor
