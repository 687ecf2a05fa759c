#include <gtest/gtest.h>
#include "download/download_state.hpp"

using namespace ifs::download;

class DownloadStateTest : public ::testing::Test {
protected:
    DownloadState state;
};

// Test initial state
TEST_F(DownloadStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), DownloadState::State::RESOLVING);
    EXPECT_EQ(state.get_state_string(), "RESOLVING");
    EXPECT_FALSE(state.is_terminal());
}

// Test the successful path
TEST_F(DownloadStateTest, ValidTransitions) {
    EXPECT_TRUE(state.transition_to(DownloadState::State::STREAMING));
    EXPECT_EQ(state.get_state(), DownloadState::State::STREAMING);

    EXPECT_TRUE(state.transition_to(DownloadState::State::COMPLETED));
    EXPECT_EQ(state.get_state(), DownloadState::State::COMPLETED);
    EXPECT_TRUE(state.is_terminal());
}

// Test invalid state transitions
TEST_F(DownloadStateTest, InvalidTransitions) {
    // Can't complete before streaming
    EXPECT_FALSE(state.transition_to(DownloadState::State::COMPLETED));
    EXPECT_EQ(state.get_state(), DownloadState::State::RESOLVING);

    EXPECT_TRUE(state.transition_to(DownloadState::State::STREAMING));

    // Can't go back to resolving
    EXPECT_FALSE(state.transition_to(DownloadState::State::RESOLVING));
    EXPECT_EQ(state.get_state(), DownloadState::State::STREAMING);
}

// Test that terminal states are final
TEST_F(DownloadStateTest, TerminalStatesAreFinal) {
    const DownloadState::State terminals[] = {
        DownloadState::State::COMPLETED,
        DownloadState::State::FAILED,
        DownloadState::State::CANCELLED
    };
    const DownloadState::State all[] = {
        DownloadState::State::RESOLVING,
        DownloadState::State::STREAMING,
        DownloadState::State::COMPLETED,
        DownloadState::State::FAILED,
        DownloadState::State::CANCELLED
    };

    for (auto from : terminals) {
        EXPECT_TRUE(DownloadState::is_terminal(from));
        for (auto to : all) {
            EXPECT_FALSE(DownloadState::is_valid_transition(from, to))
                << DownloadState::state_to_string(from) << " -> " << DownloadState::state_to_string(to);
        }
    }
}

// Test failure and cancellation from both live states
TEST_F(DownloadStateTest, FailureAndCancellation) {
    EXPECT_TRUE(DownloadState::is_valid_transition(DownloadState::State::RESOLVING, DownloadState::State::FAILED));
    EXPECT_TRUE(DownloadState::is_valid_transition(DownloadState::State::STREAMING, DownloadState::State::FAILED));
    EXPECT_TRUE(DownloadState::is_valid_transition(DownloadState::State::RESOLVING, DownloadState::State::CANCELLED));
    EXPECT_TRUE(DownloadState::is_valid_transition(DownloadState::State::STREAMING, DownloadState::State::CANCELLED));

    EXPECT_TRUE(state.transition_to(DownloadState::State::CANCELLED));
    EXPECT_FALSE(state.transition_to(DownloadState::State::FAILED)) << "Only one terminal state may be reached";
}

// Test state to string conversion
TEST_F(DownloadStateTest, StateToString) {
    EXPECT_EQ(DownloadState::state_to_string(DownloadState::State::RESOLVING), "RESOLVING");
    EXPECT_EQ(DownloadState::state_to_string(DownloadState::State::STREAMING), "STREAMING");
    EXPECT_EQ(DownloadState::state_to_string(DownloadState::State::COMPLETED), "COMPLETED");
    EXPECT_EQ(DownloadState::state_to_string(DownloadState::State::FAILED), "FAILED");
    EXPECT_EQ(DownloadState::state_to_string(DownloadState::State::CANCELLED), "CANCELLED");
}
