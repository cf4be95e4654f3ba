/**
 * @file Board.hpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Board revision lookup and the set of BCM GPIO ids usable per revision.
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

#include <string>
#include <vector>

namespace rpireactor {

enum class BoardRevision {
    Unknown = 0,
    Rev1 = 1,      // Model B rev 1
    Rev2 = 2,      // Model A/B rev 2 (P5 header adds 28..31)
    Rev3 = 3       // B+ and later 40-pin headers
};

const std::vector<int>& valid_gpio_ids(BoardRevision revision);
bool is_valid_gpio(BoardRevision revision, int gpio);

// Parses "Hardware" and "Revision" from a cpuinfo file.
// Returns Unknown if the file is unreadable or not a Raspberry Pi.
BoardRevision detect_board_revision(const std::string& cpuinfo_path = "/proc/cpuinfo");

const char* to_string(BoardRevision revision);

} // namespace rpireactor
