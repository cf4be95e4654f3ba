/**
 * @file PulseGeneratorTest.cpp
 * @version 3.0.0
 * @date 2026-03-14
 * @author Leonardo Lisa
 * @brief Frequency/duty planning on top of PwmScheduler.
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
#include "NullPwmDriver.hpp"
#include "PulseGenerator.hpp"
#include <gtest/gtest.h>

using namespace rpireactor;

namespace {

class PulseGeneratorTest : public ::testing::Test {
protected:
    NullPwmDriver driver;
    PwmScheduler scheduler{driver};
};

} // namespace

TEST_F(PulseGeneratorTest, FrequencyBounds) {
    PulseGenerator generator(scheduler, 10000, 10);
    EXPECT_DOUBLE_EQ(100.0, generator.freq_min());
    EXPECT_DOUBLE_EQ(50000.0, generator.freq_max());
}

TEST_F(PulseGeneratorTest, FourHundredHertzAtTenMicrosecondSteps) {
    PulseGenerator generator(scheduler, 10000, 10);
    PulsePlan plan = generator.set_frequency(17, 400, "50%");

    EXPECT_EQ(4, plan.periods_per_subcycle);
    EXPECT_EQ(250, plan.period_steps);
    EXPECT_EQ(125, plan.pulse_width_steps);
    EXPECT_EQ(125, plan.pause_steps);
    EXPECT_EQ((std::vector<int>{0, 250, 500, 750}), plan.start_steps);
    EXPECT_DOUBLE_EQ(400.0, plan.actual_freq_hz);

    std::vector<Pulse> pulses = scheduler.pulses(0, 17);
    ASSERT_EQ(4u, pulses.size());
    for (const Pulse& p : pulses) EXPECT_EQ(125, p.width_step);
}

TEST_F(PulseGeneratorTest, FourHundredHertzAtHundredMicrosecondSteps) {
    PulseGenerator generator(scheduler, 10000, 100);
    PulsePlan plan = generator.set_frequency(17, 400, "50%");

    EXPECT_EQ(4, plan.periods_per_subcycle);
    EXPECT_EQ(25, plan.period_steps);
    EXPECT_EQ(12, plan.pulse_width_steps);
    EXPECT_EQ(13, plan.pause_steps);
    EXPECT_EQ((std::vector<int>{0, 25, 50, 75}), plan.start_steps);
    EXPECT_EQ(4u, scheduler.pulses(0, 17).size());
}

TEST_F(PulseGeneratorTest, OutOfRangeFrequencyChangesNothing) {
    PulseGenerator generator(scheduler, 10000, 10);
    EXPECT_THROW(generator.set_frequency(17, 50001), ConfigurationError);
    EXPECT_THROW(generator.set_frequency(17, 99.5), ConfigurationError);
    EXPECT_FALSE(scheduler.is_setup());
    EXPECT_TRUE(driver.calls().empty());
}

TEST_F(PulseGeneratorTest, RoundingIsReportedNotCorrected) {
    PulseGenerator generator(scheduler, 10000, 10);
    PulsePlan plan = generator.set_frequency(18, 333);

    EXPECT_EQ(3, plan.periods_per_subcycle);
    EXPECT_EQ(333, plan.period_steps);
    EXPECT_EQ(166, plan.pulse_width_steps);
    EXPECT_DOUBLE_EQ(333.0, plan.requested_freq_hz);
    EXPECT_DOUBLE_EQ(300.0, plan.actual_freq_hz);
}

TEST_F(PulseGeneratorTest, ReconfiguringPinReplacesItsPulses) {
    PulseGenerator generator(scheduler, 10000, 10);
    generator.set_frequency(17, 400);
    generator.set_frequency(18, 100, "10%");
    generator.set_frequency(17, 200);

    EXPECT_EQ(2u, scheduler.pulses(0, 17).size());
    ASSERT_EQ(1u, scheduler.pulses(0, 18).size());
    EXPECT_EQ((Pulse{18, 0, 100}), scheduler.pulses(0, 18)[0]);
}

TEST_F(PulseGeneratorTest, AbsoluteWidth) {
    PulseGenerator generator(scheduler, 10000, 10);
    PulsePlan plan = generator.set_frequency(17, 400, "20us");
    EXPECT_EQ(2, plan.pulse_width_steps);
    EXPECT_EQ(248, plan.pause_steps);

    EXPECT_THROW(generator.set_frequency(17, 400, "5us"), ConfigurationError);
    EXPECT_THROW(generator.set_frequency(17, 400, "3000us"), ConfigurationError);
}

TEST_F(PulseGeneratorTest, ZeroDutyClearsPin) {
    PulseGenerator generator(scheduler, 10000, 10);
    generator.set_frequency(17, 400);
    PulsePlan plan = generator.set_frequency(17, 400, "0%");

    EXPECT_EQ(0, plan.pulse_width_steps);
    EXPECT_TRUE(plan.start_steps.empty());
    EXPECT_TRUE(scheduler.pulses(0, 17).empty());
}

TEST_F(PulseGeneratorTest, StopClearsPin) {
    PulseGenerator generator(scheduler, 10000, 10);
    generator.set_frequency(17, 400, "50%", 2);
    generator.stop(17, 2);
    EXPECT_TRUE(scheduler.pulses(2, 17).empty());
    EXPECT_NO_THROW(generator.stop(17, 2));
    EXPECT_NO_THROW(generator.stop(17, 5));
}

TEST_F(PulseGeneratorTest, MismatchedSchedulerIsConflict) {
    scheduler.setup(5);
    PulseGenerator generator(scheduler, 10000, 10);
    EXPECT_THROW(generator.set_frequency(17, 400), ConflictError);

    PwmScheduler other_scheduler(driver);
    other_scheduler.setup(10);
    other_scheduler.init_channel(0, 20000);
    PulseGenerator other(other_scheduler, 10000, 10);
    EXPECT_THROW(other.set_frequency(17, 400), ConflictError);
}

TEST(DutyTest, Parse) {
    Duty half = Duty::parse("50%");
    EXPECT_EQ(Duty::Unit::Percent, half.unit);
    EXPECT_EQ(50, half.value);

    Duty width = Duty::parse("20 us");
    EXPECT_EQ(Duty::Unit::Microseconds, width.unit);
    EXPECT_EQ(20, width.value);
    EXPECT_EQ(150, Duty::parse("150us").value);
    EXPECT_EQ(0, Duty::parse("0%").value);
}

TEST(DutyTest, RejectsMalformedInput) {
    EXPECT_THROW(Duty::parse("100%"), ConfigurationError);
    EXPECT_THROW(Duty::parse("-5%"), ConfigurationError);
    EXPECT_THROW(Duty::parse("12"), ConfigurationError);
    EXPECT_THROW(Duty::parse("abc"), ConfigurationError);
    EXPECT_THROW(Duty::parse("0us"), ConfigurationError);
    EXPECT_THROW(Duty::parse("1.5%"), ConfigurationError);
    EXPECT_THROW(Duty::parse(""), ConfigurationError);
}
