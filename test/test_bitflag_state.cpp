// test/test_bitflag_state.cpp

#include <gtest/gtest.h>

#include <vector>

#include "session_state.h"

using namespace GridLink::State;

TEST(BitFlagStateTest, AddFlagIsTestAndSet) {
    BitFlagStateMachine machine("test");

    EXPECT_TRUE(machine.add_flag(3));
    EXPECT_FALSE(machine.add_flag(3));
    EXPECT_TRUE(machine.has_flag(3));
    EXPECT_FALSE(machine.has_flag(2));
}

TEST(BitFlagStateTest, RemoveFlagReportsChange) {
    BitFlagStateMachine machine("test");
    machine.add_flag(1);

    EXPECT_TRUE(machine.remove_flag(1));
    EXPECT_FALSE(machine.remove_flag(1));
    EXPECT_EQ(machine.get_state(), 0);
}

TEST(BitFlagStateTest, FlagsBeyondSixtyFourBits) {
    BitFlagStateMachine machine("wide");
    machine.add_flag(100);

    EXPECT_TRUE(machine.has_flag(100));
    EXPECT_TRUE(machine.has_all_flags({100}));
    EXPECT_FALSE(machine.has_all_flags({100, 0}));
}

TEST(BitFlagStateTest, TransitionMayChangeFlagsAgain) {
    BitFlagStateMachine machine("reentrant");
    machine.on_flag_added(5, [&machine](const cpp_int&, const cpp_int&) {
        machine.add_flag(6);
    });

    machine.add_flag(5);

    EXPECT_TRUE(machine.has_flag(6));
}

TEST(BitFlagStateTest, GlobalListenerSeesEveryChange) {
    BitFlagStateMachine machine("listener");
    std::vector<cpp_int> seen;
    machine.add_global_listener([&seen](const cpp_int&, const cpp_int& now) {
        seen.push_back(now);
    });

    machine.add_flag(0);
    machine.add_flag(1);
    machine.add_flag(1);
    machine.remove_flag(0);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen.back(), 2);
}

TEST(SessionStatusTest, ClosingStopsListening) {
    SessionStatus status("m0");
    status.state.add_flag(SessionFlags::OPENED);
    status.state.add_flag(SessionFlags::INITIALIZED);
    status.state.add_flag(SessionFlags::NEGOTIATED);
    status.state.add_flag(SessionFlags::LISTENING);
    EXPECT_TRUE(status.is_established());

    status.state.add_flag(SessionFlags::CLOSED);

    EXPECT_FALSE(status.state.has_flag(SessionFlags::LISTENING));
    EXPECT_FALSE(status.is_established());
}

TEST(SessionStatusTest, DescribeNamesSetFlags) {
    SessionStatus status("m0");
    status.state.add_flag(SessionFlags::OPENED);
    status.state.add_flag(SessionFlags::HANDLER_ERROR);

    std::string description = status.describe();
    EXPECT_NE(description.find("opened"), std::string::npos);
    EXPECT_NE(description.find("handler_error"), std::string::npos);
    EXPECT_EQ(description.find("listening"), std::string::npos);
}
