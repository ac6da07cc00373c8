// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for Mode and ModeManager
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "mode_manager.hpp"

using namespace reel::replay;

// ============================================================================
// Mode String Conversion Tests
// ============================================================================

TEST(ModeTest, ModeToString) {
  EXPECT_EQ(mode_to_string(Mode::IDLE), "idle");
  EXPECT_EQ(mode_to_string(Mode::RECORDING), "recording");
  EXPECT_EQ(mode_to_string(Mode::PLAYING), "playing");
}

TEST(ModeTest, StringToMode) {
  EXPECT_EQ(string_to_mode("idle"), Mode::IDLE);
  EXPECT_EQ(string_to_mode("recording"), Mode::RECORDING);
  EXPECT_EQ(string_to_mode("playing"), Mode::PLAYING);

  // Unknown string defaults to IDLE
  EXPECT_EQ(string_to_mode("paused"), Mode::IDLE);
  EXPECT_EQ(string_to_mode(""), Mode::IDLE);
}

// ============================================================================
// ModeManager Tests
// ============================================================================

class ModeManagerTest : public ::testing::Test {
protected:
  ModeManager modes_;
};

TEST_F(ModeManagerTest, InitialMode) {
  EXPECT_EQ(modes_.get_mode(), Mode::IDLE);
  EXPECT_EQ(modes_.get_mode_string(), "idle");
  EXPECT_TRUE(modes_.is_mode(Mode::IDLE));
  EXPECT_FALSE(modes_.is_active());
}

TEST_F(ModeManagerTest, RecordingRoundTrip) {
  std::string error_msg;
  EXPECT_TRUE(modes_.transition_to(Mode::RECORDING, error_msg));
  EXPECT_TRUE(error_msg.empty());
  EXPECT_TRUE(modes_.is_active());

  EXPECT_TRUE(modes_.transition_to(Mode::IDLE, error_msg));
  EXPECT_EQ(modes_.get_mode(), Mode::IDLE);
}

TEST_F(ModeManagerTest, PlayingRoundTrip) {
  std::string error_msg;
  EXPECT_TRUE(modes_.transition(Mode::IDLE, Mode::PLAYING, error_msg));
  EXPECT_TRUE(modes_.is_mode(Mode::PLAYING));
  EXPECT_TRUE(modes_.transition(Mode::PLAYING, Mode::IDLE, error_msg));
  EXPECT_FALSE(modes_.is_active());
}

TEST_F(ModeManagerTest, NoDirectSwitchBetweenRecordingAndPlaying) {
  std::string error_msg;
  ASSERT_TRUE(modes_.transition_to(Mode::RECORDING, error_msg));

  EXPECT_FALSE(modes_.transition_to(Mode::PLAYING, error_msg));
  EXPECT_NE(error_msg.find("ERR_INVALID_STATE"), std::string::npos);
  EXPECT_NE(error_msg.find("recording"), std::string::npos);
  EXPECT_EQ(modes_.get_mode(), Mode::RECORDING);
}

TEST_F(ModeManagerTest, SelfTransitionsAreInvalid) {
  EXPECT_FALSE(modes_.is_valid_transition(Mode::IDLE, Mode::IDLE));
  EXPECT_FALSE(modes_.is_valid_transition(Mode::RECORDING, Mode::RECORDING));
  EXPECT_FALSE(modes_.is_valid_transition(Mode::PLAYING, Mode::PLAYING));

  std::string error_msg;
  EXPECT_FALSE(modes_.transition_to(Mode::IDLE, error_msg));
  EXPECT_FALSE(error_msg.empty());
}

TEST_F(ModeManagerTest, CheckedTransitionRejectsWrongSource) {
  std::string error_msg;
  EXPECT_FALSE(modes_.transition(Mode::RECORDING, Mode::IDLE, error_msg));
  EXPECT_NE(error_msg.find("Expected mode recording"), std::string::npos);
  EXPECT_EQ(modes_.get_mode(), Mode::IDLE);
}

TEST_F(ModeManagerTest, ValidTransitionsFromEachMode) {
  auto from_idle = modes_.get_valid_transitions();
  EXPECT_EQ(from_idle.size(), 2u);

  std::string error_msg;
  ASSERT_TRUE(modes_.transition_to(Mode::PLAYING, error_msg));
  EXPECT_EQ(modes_.get_valid_transitions(), std::vector<Mode>{Mode::IDLE});
}

TEST_F(ModeManagerTest, CallbacksSeeEveryTransition) {
  std::vector<std::pair<Mode, Mode>> seen;
  modes_.register_transition_callback([&seen](Mode from, Mode to) {
    seen.emplace_back(from, to);
  });

  std::string error_msg;
  modes_.transition_to(Mode::RECORDING, error_msg);
  modes_.transition_to(Mode::PLAYING, error_msg);  // rejected
  modes_.transition_to(Mode::IDLE, error_msg);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], std::make_pair(Mode::IDLE, Mode::RECORDING));
  EXPECT_EQ(seen[1], std::make_pair(Mode::RECORDING, Mode::IDLE));
}

TEST_F(ModeManagerTest, CallbackMayQueryManager) {
  Mode observed = Mode::IDLE;
  modes_.register_transition_callback([this, &observed](Mode, Mode) {
    observed = modes_.get_mode();
  });

  std::string error_msg;
  ASSERT_TRUE(modes_.transition_to(Mode::PLAYING, error_msg));
  EXPECT_EQ(observed, Mode::PLAYING);
}

TEST_F(ModeManagerTest, ResetReturnsToIdle) {
  std::string error_msg;
  modes_.transition_to(Mode::RECORDING, error_msg);
  modes_.reset();
  EXPECT_EQ(modes_.get_mode(), Mode::IDLE);
}

TEST_F(ModeManagerTest, ConcurrentEntryHasSingleWinner) {
  constexpr int kThreads = 16;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, &winners, i] {
      std::string error_msg;
      Mode target = (i % 2 == 0) ? Mode::RECORDING : Mode::PLAYING;
      if (modes_.transition(Mode::IDLE, target, error_msg)) {
        ++winners;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(winners.load(), 1);
  EXPECT_TRUE(modes_.is_active());
}

// ============================================================================
// ModeTransactionGuard Tests
// ============================================================================

TEST_F(ModeManagerTest, GuardRollsBackWhenNotCommitted) {
  std::string error_msg;
  {
    ASSERT_TRUE(modes_.transition_to(Mode::PLAYING, error_msg));
    ModeTransactionGuard guard(modes_, Mode::IDLE);
    EXPECT_FALSE(guard.is_committed());
    EXPECT_EQ(guard.get_rollback_mode(), Mode::IDLE);
  }
  EXPECT_EQ(modes_.get_mode(), Mode::IDLE);
}

TEST_F(ModeManagerTest, GuardKeepsCommittedTransition) {
  std::string error_msg;
  {
    ASSERT_TRUE(modes_.transition_to(Mode::RECORDING, error_msg));
    ModeTransactionGuard guard(modes_, Mode::IDLE);
    guard.commit();
    EXPECT_TRUE(guard.is_committed());
  }
  EXPECT_EQ(modes_.get_mode(), Mode::RECORDING);
}

TEST_F(ModeManagerTest, GuardRollsBackOnException) {
  std::string error_msg;
  try {
    ASSERT_TRUE(modes_.transition_to(Mode::RECORDING, error_msg));
    ModeTransactionGuard guard(modes_, Mode::IDLE);
    throw std::runtime_error("install failed");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(modes_.get_mode(), Mode::IDLE);
}
