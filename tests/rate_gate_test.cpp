// rate_gate_test.cpp — fixed-rate request gate with a fake clock

#include <gtest/gtest.h>

#include "settlement/rate_gate.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <stdexcept>

using namespace std::chrono_literals;

TEST(RateGateTest, FirstRequestDoesNotWait) {
    test_helpers::FakeClock clock;
    auto gate = clock.make_gate();
    gate.wait_to_proceed();
    EXPECT_TRUE(clock.sleeps.empty());
    EXPECT_EQ(gate.total_waits(), 1);
}

TEST(RateGateTest, BackToBackRequestsAreSpacedByPeriod) {
    test_helpers::FakeClock clock;
    auto gate = clock.make_gate();
    gate.wait_to_proceed();
    gate.wait_to_proceed();
    gate.wait_to_proceed();
    ASSERT_EQ(clock.sleeps.size(), 2u);
    EXPECT_EQ(clock.sleeps[0], RateGate::Clock::duration(5s));
    EXPECT_EQ(clock.sleeps[1], RateGate::Clock::duration(5s));
}

TEST(RateGateTest, WaitsOnlyForRemainderOfPeriod) {
    test_helpers::FakeClock clock;
    auto gate = clock.make_gate();
    gate.wait_to_proceed();
    clock.now += 3s;
    gate.wait_to_proceed();
    ASSERT_EQ(clock.sleeps.size(), 1u);
    EXPECT_EQ(clock.sleeps[0], RateGate::Clock::duration(2s));
}

TEST(RateGateTest, NoWaitOncePeriodElapsed) {
    test_helpers::FakeClock clock;
    auto gate = clock.make_gate();
    gate.wait_to_proceed();
    clock.now += 6s;
    gate.wait_to_proceed();
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST(RateGateTest, BurstAllowanceWithinPeriod) {
    test_helpers::FakeClock clock;
    auto gate = clock.make_gate(2, 5s);
    gate.wait_to_proceed();
    gate.wait_to_proceed();
    EXPECT_TRUE(clock.sleeps.empty());
    gate.wait_to_proceed();
    EXPECT_EQ(clock.sleeps.size(), 1u);
}

TEST(RateGateTest, RejectsNonPositiveCapacity) {
    EXPECT_THROW(RateGate(0, 5s), std::invalid_argument);
}
