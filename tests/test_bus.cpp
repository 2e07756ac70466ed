#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "bus/bus.hpp"

using namespace kennel;
using namespace kennel::events;

class BusTest : public ::testing::Test {
 protected:
  Bus bus_;
};

// 1. Subscribe and publish
TEST_F(BusTest, SubscribeAndPublish) {
  std::string received_id;
  bus_.subscribe<ServerQuarantined>([&](const ServerQuarantined &e) {
    received_id = e.server_id;
  });

  bus_.publish(ServerQuarantined{.server_id = "fs", .reason = "fatal"});

  EXPECT_EQ(received_id, "fs");
}

// 2. Every subscriber of a type receives the event
TEST_F(BusTest, MultipleSubscribers) {
  int call_count = 0;
  std::string received_a;
  std::string received_b;

  bus_.subscribe<QuarantineCleared>([&](const QuarantineCleared &e) {
    received_a = e.server_id;
    ++call_count;
  });
  bus_.subscribe<QuarantineCleared>([&](const QuarantineCleared &e) {
    received_b = e.server_id;
    ++call_count;
  });

  bus_.publish(QuarantineCleared{.server_id = "multi"});

  EXPECT_EQ(call_count, 2);
  EXPECT_EQ(received_a, "multi");
  EXPECT_EQ(received_b, "multi");
}

// 3. No delivery after unsubscribe
TEST_F(BusTest, Unsubscribe) {
  int call_count = 0;
  auto sub = bus_.subscribe<ServerStateChanged>([&](const ServerStateChanged &) {
    ++call_count;
  });

  bus_.publish(ServerStateChanged{.server_id = "a", .old_state = "stopped", .new_state = "starting"});
  EXPECT_EQ(call_count, 1);

  bus_.unsubscribe(sub);
  EXPECT_EQ(bus_.subscriber_count(), 0u);

  bus_.publish(ServerStateChanged{.server_id = "a", .old_state = "starting", .new_state = "running"});
  EXPECT_EQ(call_count, 1);
}

// 4. Event types do not cross
TEST_F(BusTest, TypeSafety) {
  bool state_handler_called = false;
  bool circuit_handler_called = false;

  bus_.subscribe<ServerStateChanged>([&](const ServerStateChanged &) {
    state_handler_called = true;
  });
  bus_.subscribe<CircuitStateChanged>([&](const CircuitStateChanged &) {
    circuit_handler_called = true;
  });

  bus_.publish(CircuitStateChanged{.server_id = "s", .old_state = "closed", .new_state = "open"});

  EXPECT_FALSE(state_handler_called);
  EXPECT_TRUE(circuit_handler_called);
}

// 5. Publishing without subscribers is harmless
TEST_F(BusTest, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus_.publish(ServerQuarantined{.server_id = "nobody", .reason = "r"}));
  EXPECT_NO_THROW(bus_.publish(McpToolsChanged{.server_name = "nobody"}));
}

// 6. Instances are independent
TEST_F(BusTest, InstancesAreIsolated) {
  Bus other;
  int calls = 0;
  other.subscribe<McpToolsChanged>([&](const McpToolsChanged &) {
    ++calls;
  });

  bus_.publish(McpToolsChanged{.server_name = "x"});
  EXPECT_EQ(calls, 0);
}

// 7. A handler may unsubscribe itself while being invoked
TEST_F(BusTest, HandlerCanUnsubscribeDuringPublish) {
  int calls = 0;
  Bus::SubscriptionId self = 0;
  self = bus_.subscribe<QuarantineCleared>([&](const QuarantineCleared &) {
    ++calls;
    bus_.unsubscribe(self);
  });

  bus_.publish(QuarantineCleared{.server_id = "a"});
  bus_.publish(QuarantineCleared{.server_id = "b"});

  EXPECT_EQ(calls, 1);
}

// 8. MCP tool change events keep their order
TEST_F(BusTest, McpToolsChangedEvent) {
  std::vector<std::string> received_servers;

  bus_.subscribe<McpToolsChanged>([&](const McpToolsChanged &e) {
    received_servers.push_back(e.server_name);
  });

  bus_.publish(McpToolsChanged{.server_name = "mcp-server-filesystem"});
  bus_.publish(McpToolsChanged{.server_name = "mcp-server-github"});

  ASSERT_EQ(received_servers.size(), 2u);
  EXPECT_EQ(received_servers[0], "mcp-server-filesystem");
  EXPECT_EQ(received_servers[1], "mcp-server-github");
}

// 9. Concurrent publishers
TEST_F(BusTest, ConcurrentPublish) {
  std::atomic<int> calls{0};
  bus_.subscribe<McpToolsChanged>([&](const McpToolsChanged &) {
    ++calls;
  });

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < 250; ++i) {
        bus_.publish(McpToolsChanged{.server_name = "s"});
      }
    });
  }
  for (auto &t : threads) t.join();

  EXPECT_EQ(calls.load(), 1000);
}
