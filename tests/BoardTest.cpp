/**
 * @file BoardTest.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Board revision detection and per-revision GPIO sets.
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

#include "Board.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace rpireactor;
using rpireactor::test::TempDir;
using rpireactor::test::write_file;

namespace {

BoardRevision detect(const TempDir& dir, const std::string& hardware, const std::string& revision) {
    const std::string path = dir.path() + "/cpuinfo";
    write_file(path, "processor\t: 0\nmodel name\t: ARMv6-compatible processor rev 7 (v6l)\n"
                     "Hardware\t: " + hardware + "\nRevision\t: " + revision + "\nSerial\t\t: 00000000deadbeef\n");
    return detect_board_revision(path);
}

} // namespace

TEST(BoardTest, ValidGpioSetsFollowHeaderLayout) {
    EXPECT_TRUE(is_valid_gpio(BoardRevision::Rev1, 0));
    EXPECT_TRUE(is_valid_gpio(BoardRevision::Rev1, 21));
    EXPECT_FALSE(is_valid_gpio(BoardRevision::Rev1, 2));
    EXPECT_FALSE(is_valid_gpio(BoardRevision::Rev1, 27));

    EXPECT_TRUE(is_valid_gpio(BoardRevision::Rev2, 2));
    EXPECT_TRUE(is_valid_gpio(BoardRevision::Rev2, 31));
    EXPECT_FALSE(is_valid_gpio(BoardRevision::Rev2, 21));

    for (int gpio = 2; gpio <= 27; ++gpio) {
        EXPECT_TRUE(is_valid_gpio(BoardRevision::Rev3, gpio)) << gpio;
    }
    EXPECT_FALSE(is_valid_gpio(BoardRevision::Rev3, 0));
    EXPECT_FALSE(is_valid_gpio(BoardRevision::Rev3, 28));

    EXPECT_TRUE(valid_gpio_ids(BoardRevision::Unknown).empty());
}

TEST(BoardTest, DetectsClassicRevisionCodes) {
    TempDir dir;
    EXPECT_EQ(BoardRevision::Rev1, detect(dir, "BCM2708", "0002"));
    EXPECT_EQ(BoardRevision::Rev1, detect(dir, "BCM2708", "0003"));
    EXPECT_EQ(BoardRevision::Rev2, detect(dir, "BCM2708", "000e"));
    EXPECT_EQ(BoardRevision::Rev3, detect(dir, "BCM2708", "0010"));
    EXPECT_EQ(BoardRevision::Rev3, detect(dir, "BCM2835", "0013"));
}

TEST(BoardTest, OverVoltPrefixIsIgnored) {
    TempDir dir;
    EXPECT_EQ(BoardRevision::Rev1, detect(dir, "BCM2708", "1000002"));
}

TEST(BoardTest, NewStyleRevisionCodesAreFortyPin) {
    TempDir dir;
    EXPECT_EQ(BoardRevision::Rev3, detect(dir, "BCM2835", "a02082"));
    EXPECT_EQ(BoardRevision::Rev3, detect(dir, "BCM2835", "c03111"));
}

TEST(BoardTest, UnknownHardwareOrMissingFile) {
    TempDir dir;
    EXPECT_EQ(BoardRevision::Unknown, detect(dir, "Intel(R) Core(TM)", "0002"));
    EXPECT_EQ(BoardRevision::Unknown, detect_board_revision(dir.path() + "/does-not-exist"));
}
