/**
 * @file Board.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Board revision detection from /proc/cpuinfo and valid GPIO tables.
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

#include "Board.hpp"
#include "Log.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace rpireactor {

namespace {

const std::vector<int> kGpioListRev1 = {0, 1, 4, 7, 8, 9, 10, 11, 14, 15, 17, 18, 21, 22, 23, 24, 25};
const std::vector<int> kGpioListRev2 = {2, 3, 4, 7, 8, 9, 10, 11, 14, 15, 17, 18, 22, 23, 24, 25,
                                        27, 28, 29, 30, 31};
const std::vector<int> kGpioListRev3 = {2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17,
                                        18, 19, 20, 21, 22, 23, 24, 25, 26, 27};
const std::vector<int> kGpioListNone = {};

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

const std::vector<int>& valid_gpio_ids(BoardRevision revision) {
    switch (revision) {
    case BoardRevision::Rev1: return kGpioListRev1;
    case BoardRevision::Rev2: return kGpioListRev2;
    case BoardRevision::Rev3: return kGpioListRev3;
    default: return kGpioListNone;
    }
}

bool is_valid_gpio(BoardRevision revision, int gpio) {
    const auto& ids = valid_gpio_ids(revision);
    return std::find(ids.begin(), ids.end(), gpio) != ids.end();
}

BoardRevision detect_board_revision(const std::string& cpuinfo_path) {
    std::ifstream in(cpuinfo_path);
    if (!in.is_open()) {
        log(LogLevel::Warning, "Board") << "Cannot read " << cpuinfo_path;
        return BoardRevision::Unknown;
    }

    std::string hardware;
    std::string revision;
    std::string line;
    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        const std::string key = trim(line.substr(0, colon));
        const std::string value = trim(line.substr(colon + 1));
        if (key == "Hardware") hardware = value;
        else if (key == "Revision") revision = value;
    }

    if (hardware.rfind("BCM27", 0) != 0 && hardware.rfind("BCM28", 0) != 0) {
        return BoardRevision::Unknown;
    }

    // New-style revision codes (bit 23 set) are all 40-pin boards
    unsigned long code = 0;
    std::istringstream hex(revision);
    hex >> std::hex >> code;
    if (code & (1UL << 23)) return BoardRevision::Rev3;

    // Over-volted boards carry a leading "100" prefix (e.g. 1000002)
    if (revision.size() > 4) revision = revision.substr(revision.size() - 4);

    if (revision == "0002" || revision == "0003") return BoardRevision::Rev1;
    if (revision == "0010" || revision == "0012" || revision == "0013") return BoardRevision::Rev3;

    return BoardRevision::Rev2;
}

const char* to_string(BoardRevision revision) {
    switch (revision) {
    case BoardRevision::Rev1: return "rev1";
    case BoardRevision::Rev2: return "rev2";
    case BoardRevision::Rev3: return "rev3";
    default: return "unknown";
    }
}

} // namespace rpireactor
