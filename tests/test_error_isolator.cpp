#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "bus/bus.hpp"
#include "mcp/error_isolator.hpp"

using namespace kennel;
using namespace kennel::mcp;
using namespace std::chrono_literals;

class ErrorIsolatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    now_ = std::make_shared<std::chrono::steady_clock::time_point>();
    bus_.subscribe<events::ServerQuarantined>([this](const events::ServerQuarantined &e) {
      quarantined_.push_back(e.server_id);
    });
    bus_.subscribe<events::QuarantineCleared>([this](const events::QuarantineCleared &e) {
      cleared_.push_back(e.server_id);
    });
    bus_.subscribe<events::CircuitStateChanged>([this](const events::CircuitStateChanged &e) {
      circuit_.push_back(e.old_state + "->" + e.new_state);
    });
  }

  std::unique_ptr<ErrorIsolator> make(IsolatorOptions options = {}) {
    auto now = now_;
    return std::make_unique<ErrorIsolator>(options, [now] { return *now; }, system_wall_clock(), &bus_);
  }

  void advance(std::chrono::milliseconds d) {
    *now_ += d;
  }

  // One failing call through the isolator
  static void failing_call(ErrorIsolator &isolator, const std::string &id) {
    EXPECT_THROW(isolator.call(id, []() -> int { throw ConnectionError("connection reset"); }), ConnectionError);
  }

  std::shared_ptr<std::chrono::steady_clock::time_point> now_;
  Bus bus_;
  std::vector<std::string> quarantined_;
  std::vector<std::string> cleared_;
  std::vector<std::string> circuit_;
};

TEST_F(ErrorIsolatorTest, SuccessPassesThrough) {
  auto isolator = make();
  EXPECT_EQ(isolator->call("fs", [] { return 42; }), 42);
  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::Closed);
  EXPECT_EQ(isolator->get_error_stats("fs").total_errors, 0u);
}

TEST_F(ErrorIsolatorTest, UnknownServerIsClosedAndClean) {
  auto isolator = make();
  EXPECT_EQ(isolator->circuit_state("nobody"), CircuitState::Closed);
  EXPECT_FALSE(isolator->is_circuit_open("nobody"));
  EXPECT_FALSE(isolator->is_quarantined("nobody"));
  EXPECT_EQ(isolator->get_error_stats("nobody").consecutive_errors, 0);
}

TEST_F(ErrorIsolatorTest, FailuresAreCountedByKind) {
  auto isolator = make();
  failing_call(*isolator, "fs");
  EXPECT_THROW(isolator->call("fs", []() -> int { throw ProtocolError("bad json"); }), ProtocolError);

  auto stats = isolator->get_error_stats("fs");
  EXPECT_EQ(stats.total_errors, 2u);
  EXPECT_EQ(stats.consecutive_errors, 2);
  EXPECT_EQ(stats.error_counts[ErrorKind::Network], 1u);
  EXPECT_EQ(stats.error_counts[ErrorKind::Protocol], 1u);
  EXPECT_EQ(stats.last_error_message, "bad json");
  EXPECT_TRUE(stats.last_error_time.has_value());

  auto j = stats.to_json();
  EXPECT_EQ(j["error_counts"]["network"], 1);
  EXPECT_EQ(j["quarantined"], false);
}

TEST_F(ErrorIsolatorTest, PlainExceptionsAreClassifiedByMessage) {
  auto isolator = make();
  EXPECT_THROW(isolator->call("fs", []() -> int { throw std::runtime_error("429 too many requests"); }), std::runtime_error);
  EXPECT_EQ(isolator->get_error_stats("fs").error_counts[ErrorKind::RateLimit], 1u);
}

TEST_F(ErrorIsolatorTest, BreakerOpensAndRejects) {
  auto isolator = make();
  for (int i = 0; i < 3; ++i) failing_call(*isolator, "fs");

  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::Open);

  int reached = 0;
  EXPECT_THROW(isolator->call("fs", [&] { return ++reached; }), CircuitOpenError);
  EXPECT_EQ(reached, 0);
  // Rejections are not provider failures
  EXPECT_EQ(isolator->get_error_stats("fs").total_errors, 3u);
  ASSERT_EQ(circuit_.size(), 1u);
  EXPECT_EQ(circuit_[0], "closed->open");
}

TEST_F(ErrorIsolatorTest, BreakersAreIndependentPerServer) {
  auto isolator = make();
  for (int i = 0; i < 3; ++i) failing_call(*isolator, "fs");

  EXPECT_EQ(isolator->call("github", [] { return 1; }), 1);
  EXPECT_EQ(isolator->circuit_state("github"), CircuitState::Closed);
}

TEST_F(ErrorIsolatorTest, HalfOpenTrialRecovers) {
  auto isolator = make();
  for (int i = 0; i < 3; ++i) failing_call(*isolator, "fs");

  advance(30s);
  EXPECT_EQ(isolator->call("fs", [] { return 7; }), 7);
  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::Closed);
  EXPECT_EQ(isolator->get_error_stats("fs").consecutive_errors, 0);
}

TEST_F(ErrorIsolatorTest, RejectedOutcomeFreesTheTrial) {
  auto isolator = make();
  for (int i = 0; i < 3; ++i) failing_call(*isolator, "fs");
  advance(30s);

  // The trial call ends with a rejection, not a provider verdict
  EXPECT_THROW(isolator->call("fs", []() -> int { throw ServerUnavailableError("fs", "stopped"); }), ServerUnavailableError);
  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::HalfOpen);
  EXPECT_EQ(isolator->call("fs", [] { return 1; }), 1);
}

TEST_F(ErrorIsolatorTest, QuarantineAfterThresholdAcrossBreakerCycles) {
  auto isolator = make();

  // 3 failures open the breaker, then failed trial calls keep counting
  for (int i = 0; i < 3; ++i) failing_call(*isolator, "fs");
  for (int i = 0; i < 6; ++i) {
    advance(isolator->options().breaker.max_cooldown);
    failing_call(*isolator, "fs");
  }
  EXPECT_FALSE(isolator->is_quarantined("fs"));
  EXPECT_EQ(isolator->get_error_stats("fs").consecutive_errors, 9);

  advance(isolator->options().breaker.max_cooldown);
  failing_call(*isolator, "fs");

  EXPECT_TRUE(isolator->is_quarantined("fs"));
  ASSERT_EQ(quarantined_.size(), 1u);
  EXPECT_EQ(quarantined_[0], "fs");

  auto stats = isolator->get_error_stats("fs");
  EXPECT_EQ(stats.quarantine_count, 1);
  EXPECT_NE(stats.quarantine_reason.find("10 consecutive failures"), std::string::npos);
  EXPECT_TRUE(stats.quarantined_at.has_value());
}

TEST_F(ErrorIsolatorTest, FatalQuarantinesImmediately) {
  auto isolator = make();
  EXPECT_THROW(isolator->call("fs", []() -> int { throw FatalServerError("license revoked"); }), FatalServerError);

  EXPECT_TRUE(isolator->is_quarantined("fs"));
  // Fatal failures do not trip the breaker
  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::Closed);
  EXPECT_NE(isolator->get_error_stats("fs").quarantine_reason.find("license revoked"), std::string::npos);
}

TEST_F(ErrorIsolatorTest, QuarantineIsStickyUntilCleared) {
  auto isolator = make();
  isolator->quarantine("fs", "manual");
  isolator->quarantine("fs", "again");

  advance(1h);
  int reached = 0;
  EXPECT_THROW(isolator->call("fs", [&] { return ++reached; }), QuarantinedServerError);
  EXPECT_EQ(reached, 0);
  EXPECT_EQ(isolator->get_error_stats("fs").quarantine_count, 1);
  EXPECT_EQ(isolator->get_error_stats("fs").quarantine_reason, "manual");

  isolator->clear_quarantine("fs");
  EXPECT_FALSE(isolator->is_quarantined("fs"));
  EXPECT_EQ(isolator->call("fs", [] { return 1; }), 1);

  ASSERT_EQ(cleared_.size(), 1u);
  EXPECT_EQ(quarantined_.size(), 1u);
}

TEST_F(ErrorIsolatorTest, ClearQuarantineResetsBreakerAndCount) {
  auto isolator = make();
  for (int i = 0; i < 3; ++i) failing_call(*isolator, "fs");
  isolator->quarantine("fs", "manual");

  isolator->clear_quarantine("fs");
  auto stats = isolator->get_error_stats("fs");
  EXPECT_EQ(stats.consecutive_errors, 0);
  EXPECT_EQ(stats.total_errors, 3u);
  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::Closed);
}

TEST_F(ErrorIsolatorTest, ClearingANonQuarantinedServerPublishesNothing) {
  auto isolator = make();
  isolator->clear_quarantine("fs");
  EXPECT_TRUE(cleared_.empty());
}

TEST_F(ErrorIsolatorTest, ThresholdIsKeptAboveBreaker) {
  IsolatorOptions options;
  options.quarantine_threshold = 2;
  auto isolator = make(options);
  EXPECT_EQ(isolator->options().quarantine_threshold, 4);
}

TEST_F(ErrorIsolatorTest, ManualBreakerControl) {
  auto isolator = make();
  isolator->force_open("fs");
  EXPECT_TRUE(isolator->is_circuit_open("fs"));
  isolator->force_close("fs");
  EXPECT_FALSE(isolator->is_circuit_open("fs"));
  isolator->force_open("fs");
  isolator->reset_breaker("fs");
  EXPECT_EQ(isolator->circuit_state("fs"), CircuitState::Closed);
}

TEST_F(ErrorIsolatorTest, RemoveServerForgetsEverything) {
  auto isolator = make();
  failing_call(*isolator, "fs");
  isolator->quarantine("fs", "x");
  ASSERT_EQ(isolator->get_all_stats().size(), 1u);

  isolator->remove_server("fs");
  EXPECT_TRUE(isolator->get_all_stats().empty());
  EXPECT_FALSE(isolator->is_quarantined("fs"));
}

TEST_F(ErrorIsolatorTest, VoidCalls) {
  auto isolator = make();
  bool ran = false;
  isolator->call("fs", [&] { ran = true; });
  EXPECT_TRUE(ran);
}
