#include <gtest/gtest.h>

#include "mcp/server_state.hpp"

using namespace kennel::mcp;

TEST(ServerStateTest, ToStringAndBack) {
  for (auto state : {ServerState::Stopped, ServerState::Starting, ServerState::Running, ServerState::Stopping, ServerState::Error,
                     ServerState::Quarantined}) {
    auto parsed = server_state_from_string(to_string(state));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, state);
  }
  EXPECT_EQ(to_string(ServerState::Quarantined), "quarantined");
  EXPECT_FALSE(server_state_from_string("paused").has_value());
}

TEST(ServerStateTest, AllowedEdges) {
  EXPECT_TRUE(is_valid_transition(ServerState::Stopped, ServerState::Starting));
  EXPECT_TRUE(is_valid_transition(ServerState::Starting, ServerState::Running));
  EXPECT_TRUE(is_valid_transition(ServerState::Starting, ServerState::Error));
  EXPECT_TRUE(is_valid_transition(ServerState::Running, ServerState::Stopping));
  EXPECT_TRUE(is_valid_transition(ServerState::Running, ServerState::Error));
  EXPECT_TRUE(is_valid_transition(ServerState::Error, ServerState::Stopping));
  EXPECT_TRUE(is_valid_transition(ServerState::Stopping, ServerState::Stopped));
  EXPECT_TRUE(is_valid_transition(ServerState::Stopped, ServerState::Quarantined));
  EXPECT_TRUE(is_valid_transition(ServerState::Quarantined, ServerState::Stopped));
}

TEST(ServerStateTest, SkippingEdgesIsRejected) {
  EXPECT_FALSE(is_valid_transition(ServerState::Stopped, ServerState::Running));
  EXPECT_FALSE(is_valid_transition(ServerState::Running, ServerState::Stopped));
  EXPECT_FALSE(is_valid_transition(ServerState::Error, ServerState::Stopped));
  EXPECT_FALSE(is_valid_transition(ServerState::Error, ServerState::Starting));
  EXPECT_FALSE(is_valid_transition(ServerState::Quarantined, ServerState::Starting));
  EXPECT_FALSE(is_valid_transition(ServerState::Quarantined, ServerState::Running));
  EXPECT_FALSE(is_valid_transition(ServerState::Running, ServerState::Quarantined));
  EXPECT_FALSE(is_valid_transition(ServerState::Stopped, ServerState::Stopped));
}
