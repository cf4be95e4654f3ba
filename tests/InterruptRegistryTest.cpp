/**
 * @file InterruptRegistryTest.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Registration rules, callback fan-out and removal.
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
#include "InterruptRegistry.hpp"
#include "NullGpioDriver.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace rpireactor;
using namespace rpireactor::test;

namespace {

const DebounceFilter::Clock::time_point t0 = DebounceFilter::Clock::time_point() + std::chrono::hours(1);

class InterruptRegistryTest : public ::testing::Test {
protected:
    TempDir dir;
    FakeSysfsGpio sysfs{dir.path()};
    NullGpioDriver driver;
    InterruptRegistry registry{driver, sysfs, BoardRevision::Rev3};

    static void noop(int, int) {}
};

} // namespace

TEST_F(InterruptRegistryTest, InvalidPinChangesNothing) {
    EXPECT_THROW(registry.add(28, noop, Edge::Both, Pull::Off, 0, DispatchMode::Sync), ConfigurationError);
    EXPECT_FALSE(registry.contains(28));
    EXPECT_TRUE(registry.pins().empty());
    EXPECT_TRUE(sysfs.exported_pins().empty());
    EXPECT_TRUE(sysfs.control_writes().empty());
    EXPECT_EQ(0, driver.setup_calls());
}

TEST_F(InterruptRegistryTest, RejectsMissingCallbackAndNegativeDebounce) {
    EXPECT_THROW(registry.add(17, nullptr, Edge::Both, Pull::Off, 0, DispatchMode::Sync), ConfigurationError);
    EXPECT_THROW(registry.add(17, noop, Edge::Both, Pull::Off, -1, DispatchMode::Sync), ConfigurationError);
    EXPECT_FALSE(registry.contains(17));
}

TEST_F(InterruptRegistryTest, EdgeConflictKeepsFirstSource) {
    int fd = registry.add(17, noop, Edge::Rising, Pull::Off, 0, DispatchMode::Sync);
    EXPECT_THROW(registry.add(17, noop, Edge::Falling, Pull::Off, 0, DispatchMode::Sync), ConflictError);

    EXPECT_EQ(1u, registry.callback_count(17));
    EXPECT_EQ(Edge::Rising, registry.edge(17));
    EXPECT_EQ(17, registry.pin_for_fd(fd).value());
    EXPECT_EQ(1u, registry.accept(17, 1, t0).size());
}

TEST_F(InterruptRegistryTest, MatchingEdgesShareSourceInOrder) {
    std::vector<int> order;
    int fd1 = registry.add(17, [&order](int, int) { order.push_back(1); }, Edge::Both, Pull::Off, 0,
                           DispatchMode::Sync);
    int fd2 = registry.add(17, [&order](int, int) { order.push_back(2); }, Edge::Both, Pull::Off, 0,
                           DispatchMode::Sync);
    EXPECT_EQ(fd1, fd2);
    EXPECT_EQ(1u, registry.value_fds().size());

    for (auto& subscriber : registry.accept(17, 1, t0)) {
        subscriber.callback(17, 1);
    }
    EXPECT_EQ((std::vector<int>{1, 2}), order);
}

TEST_F(InterruptRegistryTest, FirstRegistrationFixesDebounceWindow) {
    registry.add(17, noop, Edge::Both, Pull::Off, 100, DispatchMode::Sync);
    registry.add(17, noop, Edge::Both, Pull::Off, 0, DispatchMode::Sync);

    EXPECT_EQ(2u, registry.accept(17, 1, t0).size());
    EXPECT_TRUE(registry.accept(17, 0, t0 + std::chrono::milliseconds(50)).empty());
}

TEST_F(InterruptRegistryTest, ConfiguresPinAsInputWithPull) {
    driver.setup(17, PinFunction::Output, Pull::Off);
    registry.add(17, noop, Edge::Both, Pull::Up, 0, DispatchMode::Sync);
    EXPECT_EQ(PinFunction::Input, driver.function(17));
    EXPECT_EQ(Pull::Up, driver.pull(17));

    // Already an input: only the pull is changed
    const int setups = driver.setup_calls();
    registry.add(17, noop, Edge::Both, Pull::Down, 0, DispatchMode::Sync);
    EXPECT_EQ(setups, driver.setup_calls());
    EXPECT_EQ(Pull::Down, driver.pull(17));
}

TEST_F(InterruptRegistryTest, RemoveDropsSourceButKeepsExport) {
    int fd = registry.add(17, noop, Edge::Both, Pull::Off, 0, DispatchMode::Sync);
    registry.remove(17);

    EXPECT_FALSE(registry.contains(17));
    EXPECT_FALSE(registry.pin_for_fd(fd).has_value());
    EXPECT_TRUE(registry.accept(17, 1, t0).empty());
    EXPECT_EQ(-1, sysfs.value_fd(17));
    EXPECT_TRUE(sysfs.is_exported(17));

    EXPECT_THROW(registry.remove(17), NotFoundError);
    EXPECT_THROW(registry.edge(17), NotFoundError);
}

TEST_F(InterruptRegistryTest, ReRegisterAfterRemove) {
    registry.add(17, noop, Edge::Rising, Pull::Off, 0, DispatchMode::Sync);
    registry.remove(17);
    registry.add(17, noop, Edge::Falling, Pull::Off, 0, DispatchMode::Sync);
    EXPECT_EQ(Edge::Falling, registry.edge(17));
    EXPECT_EQ("falling", sysfs.attribute(17, "edge"));
}
