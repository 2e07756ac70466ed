#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bus/bus.hpp"
#include "fake_transport.hpp"
#include "mcp/errors.hpp"
#include "mcp/registry.hpp"

using namespace kennel;
using namespace kennel::mcp;
using namespace kennel::testing;
using namespace std::chrono_literals;

class RegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<FakeProvider>();
    now_ = std::make_shared<std::chrono::steady_clock::time_point>();

    bus_.subscribe<events::ServerStateChanged>([this](const events::ServerStateChanged &e) {
      std::lock_guard<std::mutex> lock(events_mutex_);
      state_changes_.push_back(e.server_id + ":" + e.old_state + "->" + e.new_state);
    });
    bus_.subscribe<events::ServerQuarantined>([this](const events::ServerQuarantined &e) {
      std::lock_guard<std::mutex> lock(events_mutex_);
      quarantined_.push_back(e.server_id);
    });
  }

  RegistryOptions options() {
    RegistryOptions opts;
    opts.transport_factory = fake_factory(provider_);
    opts.bus = &bus_;
    auto now = now_;
    opts.monotonic_clock = [now] { return *now; };
    opts.sleeper = [this](std::chrono::milliseconds d) {
      std::lock_guard<std::mutex> lock(events_mutex_);
      sleeps_.push_back(d);
    };
    opts.settings.start_timeout = 1000ms;
    opts.settings.stop_timeout = 500ms;
    return opts;
  }

  std::unique_ptr<Registry> make(RegistryOptions opts) {
    return std::make_unique<Registry>(std::move(opts));
  }
  std::unique_ptr<Registry> make() {
    return make(options());
  }

  static std::vector<std::string> event_types(const std::vector<Event> &events) {
    std::vector<std::string> types;
    for (const auto &e : events) types.push_back(e.event_type);
    return types;
  }

  static bool has_event(const std::vector<Event> &events, const std::string &type) {
    return std::any_of(events.begin(), events.end(), [&](const Event &e) {
      return e.event_type == type;
    });
  }

  std::shared_ptr<FakeProvider> provider_;
  std::shared_ptr<std::chrono::steady_clock::time_point> now_;
  Bus bus_;

  std::mutex events_mutex_;
  std::vector<std::string> state_changes_;
  std::vector<std::string> quarantined_;
  std::vector<std::chrono::milliseconds> sleeps_;
};

// ============================================================
// Registration
// ============================================================

TEST_F(RegistryTest, RegisterAndLookup) {
  auto registry = make();
  EXPECT_EQ(registry->register_server(fake_config("fs")), "fs");
  registry->register_server(ServerConfig("gh", "github", StdioConfig{"fake-server", {}, {}, ""}));

  ASSERT_NE(registry->get("fs"), nullptr);
  EXPECT_EQ(registry->get("nope"), nullptr);
  ASSERT_NE(registry->get_by_name("github"), nullptr);
  EXPECT_EQ(registry->get_by_name("github")->id(), "gh");
  EXPECT_EQ(registry->server_ids(), (std::vector<std::string>{"fs", "gh"}));

  auto events = registry->get_events("fs");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].event_type, "registered");
  EXPECT_EQ(*registry->status_tracker().get_metadata("gh", "name"), "github");
  EXPECT_EQ(*registry->status_tracker().get_metadata("gh", "type"), "stdio");
  // Registration does not start anything
  EXPECT_EQ(provider_->created.load(), 0);
}

TEST_F(RegistryTest, DuplicateIdOrNameIsRejected) {
  auto registry = make();
  registry->register_server(ServerConfig("fs", "filesystem", StdioConfig{"fake-server", {}, {}, ""}));

  EXPECT_THROW(registry->register_server(ServerConfig("fs", "other", StdioConfig{"x", {}, {}, ""})), ConfigurationError);
  EXPECT_THROW(registry->register_server(ServerConfig("fs2", "filesystem", StdioConfig{"x", {}, {}, ""})), ConfigurationError);
  EXPECT_EQ(registry->server_ids().size(), 1u);
}

TEST_F(RegistryTest, ListRows) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  registry->register_server(fake_config("gh").with_enabled(false));
  ASSERT_TRUE(registry->start("fs"));

  auto rows = registry->list();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].id, "fs");
  EXPECT_EQ(rows[0].state, ServerState::Running);
  EXPECT_EQ(rows[0].circuit, CircuitState::Closed);
  EXPECT_TRUE(rows[0].uptime.has_value());
  EXPECT_FALSE(rows[1].enabled);
  EXPECT_EQ(rows[1].state, ServerState::Stopped);
  EXPECT_FALSE(rows[1].uptime.has_value());

  auto j = rows[0].to_json();
  EXPECT_EQ(j["type"], "stdio");
  EXPECT_EQ(j["state"], "running");
  EXPECT_EQ(j["circuit_state"], "closed");
  EXPECT_TRUE(j["error_message"].is_null());
}

TEST_F(RegistryTest, ToolClassesFromSettings) {
  auto opts = options();
  opts.settings.tool_classes["deploy"] = tool::ToolClass::Execute;
  opts.settings.default_tool_class = tool::ToolClass::Write;
  auto registry = make(std::move(opts));

  EXPECT_EQ(registry->concurrency_gate().classify("deploy"), tool::ToolClass::Execute);
  EXPECT_EQ(registry->concurrency_gate().classify("read_file"), tool::ToolClass::Read);
  EXPECT_EQ(registry->concurrency_gate().classify("unknown_tool"), tool::ToolClass::Write);
}

// ============================================================
// Lifecycle
// ============================================================

TEST_F(RegistryTest, StartAndStop) {
  auto registry = make();
  registry->register_server(fake_config("fs"));

  ASSERT_TRUE(registry->start("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Running);
  EXPECT_EQ(registry->status_tracker().get_status("fs"), ServerState::Running);
  EXPECT_EQ(*registry->status_tracker().get_metadata("fs", "protocol_version"), "2024-11-05");
  EXPECT_EQ((*registry->status_tracker().get_metadata("fs", "server_info"))["name"], "fake");

  // Starting a running server is a no-op
  ASSERT_TRUE(registry->start("fs"));
  EXPECT_EQ(provider_->created.load(), 1);

  ASSERT_TRUE(registry->stop("fs"));
  EXPECT_EQ(registry->status_tracker().get_status("fs"), ServerState::Stopped);

  auto types = event_types(registry->get_events("fs"));
  EXPECT_NE(std::find(types.begin(), types.end(), "started"), types.end());
  EXPECT_NE(std::find(types.begin(), types.end(), "stopped"), types.end());

  std::vector<std::string> expected = {"fs:stopped->starting", "fs:starting->running", "fs:running->stopping", "fs:stopping->stopped"};
  EXPECT_EQ(state_changes_, expected);
}

TEST_F(RegistryTest, UnknownIdsReturnFalse) {
  auto registry = make();
  EXPECT_FALSE(registry->start("ghost"));
  EXPECT_FALSE(registry->stop("ghost"));
  EXPECT_FALSE(registry->remove("ghost"));
  EXPECT_FALSE(registry->reload("ghost"));
  EXPECT_FALSE(registry->enable_server("ghost"));
  EXPECT_FALSE(registry->disable_server("ghost"));
  EXPECT_FALSE(registry->clear_quarantine("ghost"));
  EXPECT_FALSE(registry->get_server_summary("ghost").has_value());
  EXPECT_TRUE(registry->get_captured_diagnostics("ghost").empty());
  EXPECT_THROW(registry->call_tool("ghost", "read_file", json::object()), ServerNotFoundError);
  EXPECT_THROW(registry->list_tools("ghost"), ServerNotFoundError);
}

TEST_F(RegistryTest, FailedStartIsReportedNotThrown) {
  provider_->connect_ok = false;
  auto registry = make();
  registry->register_server(fake_config("fs"));

  EXPECT_FALSE(registry->start("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Error);

  auto events = registry->get_events("fs");
  ASSERT_TRUE(has_event(events, "start_failed"));
  EXPECT_EQ(events.back().details["error"], "spawn failed");
  EXPECT_EQ(registry->list()[0].error_message, "spawn failed");
}

TEST_F(RegistryTest, StartAllSkipsDisabledAndRunsInParallel) {
  auto slow = std::make_shared<FakeProvider>();
  auto opts = options();
  opts.transport_factory = [slow](const ServerConfig &) -> std::unique_ptr<Transport> {
    std::this_thread::sleep_for(300ms);
    return std::make_unique<FakeTransport>(slow);
  };
  auto registry = make(std::move(opts));
  for (const char *id : {"a", "b", "c", "d"}) {
    registry->register_server(fake_config(id));
  }
  registry->register_server(fake_config("off").with_enabled(false));

  auto started = std::chrono::steady_clock::now();
  auto results = registry->start_all();
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(results.size(), 4u);
  EXPECT_EQ(results.count("off"), 0u);
  for (const auto &[id, ok] : results) {
    EXPECT_TRUE(ok) << id;
  }
  EXPECT_EQ(registry->get("off")->state(), ServerState::Stopped);
  // Four sequential starts would take at least 1200 ms
  EXPECT_LT(elapsed, 1000ms);

  auto stopped = registry->stop_all();
  EXPECT_EQ(stopped.size(), 5u);
  for (const auto &id : registry->server_ids()) {
    EXPECT_EQ(registry->get(id)->state(), ServerState::Stopped);
  }
}

TEST_F(RegistryTest, ExplicitStartEnables) {
  auto registry = make();
  registry->register_server(fake_config("fs").with_enabled(false));

  ASSERT_TRUE(registry->start("fs"));
  EXPECT_TRUE(registry->get("fs")->is_enabled());
  EXPECT_TRUE(has_event(registry->get_events("fs"), "enabled"));
}

TEST_F(RegistryTest, DisableStopsRunningServer) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  ASSERT_TRUE(registry->disable_server("fs"));
  EXPECT_FALSE(registry->get("fs")->is_enabled());
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Stopped);

  ASSERT_TRUE(registry->enable_server("fs"));
  EXPECT_TRUE(registry->get("fs")->is_enabled());
  // Enabling does not start
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Stopped);
}

TEST_F(RegistryTest, RemoveStopsAndForgets) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));
  registry->call_tool("fs", "read_file", json::object());

  ASSERT_TRUE(registry->remove("fs"));
  EXPECT_EQ(registry->get("fs"), nullptr);
  EXPECT_EQ(provider_->disconnects.load(), 1);
  EXPECT_TRUE(registry->get_events("fs").empty());
  EXPECT_EQ(registry->retry_manager().get_retry_stats("fs").total_calls, 0u);
  EXPECT_TRUE(registry->error_isolator().get_all_stats().empty());

  // The id is free again
  EXPECT_NO_THROW(registry->register_server(fake_config("fs")));
}

TEST_F(RegistryTest, ReloadBuildsAFreshStoppedInstance) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));
  auto before = registry->get("fs");
  registry->disable_server("fs");

  ASSERT_TRUE(registry->reload("fs"));
  auto after = registry->get("fs");
  EXPECT_NE(before.get(), after.get());
  EXPECT_EQ(after->state(), ServerState::Stopped);
  // The enabled flag carries over a reload
  EXPECT_FALSE(after->is_enabled());
  EXPECT_TRUE(has_event(registry->get_events("fs"), "reloaded"));

  // The old instance no longer reports into the registry
  auto changes = state_changes_.size();
  ASSERT_TRUE(registry->start("fs"));
  before->start(500ms);
  EXPECT_EQ(state_changes_.size(), changes + 2);
}

TEST_F(RegistryTest, UpdateReplacesConfig) {
  auto registry = make();
  registry->register_server(ServerConfig("fs", "filesystem", StdioConfig{"fake-server", {}, {}, ""}));
  registry->register_server(ServerConfig("gh", "github", StdioConfig{"fake-server", {}, {}, ""}));
  ASSERT_TRUE(registry->start("fs"));

  ASSERT_TRUE(registry->update("fs", ServerConfig("fs", "files", StdioConfig{"fake-server", {"--ro"}, {}, ""})));
  auto server = registry->get("fs");
  EXPECT_EQ(server->config().name(), "files");
  EXPECT_EQ(server->config().stdio()->args.size(), 1u);
  EXPECT_EQ(server->state(), ServerState::Stopped);
  EXPECT_NE(registry->get_by_name("files"), nullptr);
  EXPECT_EQ(*registry->status_tracker().get_metadata("fs", "name"), "files");
  EXPECT_TRUE(has_event(registry->get_events("fs"), "updated"));

  EXPECT_THROW(registry->update("fs", ServerConfig("other", "x", StdioConfig{"fake-server", {}, {}, ""})), ConfigurationError);
  EXPECT_THROW(registry->update("fs", ServerConfig("fs", "github", StdioConfig{"fake-server", {}, {}, ""})), ConfigurationError);
  EXPECT_FALSE(registry->update("ghost", ServerConfig("ghost", "ghost", StdioConfig{"fake-server", {}, {}, ""})));
}

TEST_F(RegistryTest, ParallelLifecycleOnDifferentIds) {
  auto registry = make();
  for (int i = 0; i < 6; ++i) {
    registry->register_server(fake_config("s" + std::to_string(i)));
  }

  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i]() {
      auto id = "s" + std::to_string(i);
      for (int round = 0; round < 10; ++round) {
        registry->start(id);
        registry->stop(id);
      }
      registry->start(id);
    });
  }
  for (auto &t : threads) t.join();

  for (const auto &row : registry->list()) {
    EXPECT_EQ(row.state, ServerState::Running) << row.id;
  }
}

TEST_F(RegistryTest, ConcurrentLifecycleOnOneIdIsSerialized) {
  auto registry = make();
  registry->register_server(fake_config("fs"));

  std::atomic<int> exceptions{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 20; ++i) {
        try {
          switch ((i + t) % 3) {
            case 0:
              registry->start("fs");
              break;
            case 1:
              registry->stop("fs");
              break;
            default:
              registry->reload("fs");
              break;
          }
        } catch (const std::exception &) {
          ++exceptions;
        }
      }
    });
  }
  for (auto &t : threads) t.join();

  EXPECT_EQ(exceptions.load(), 0);
  auto state = registry->get("fs")->state();
  EXPECT_TRUE(state == ServerState::Running || state == ServerState::Stopped);
}

// ============================================================
// Re-entrant bus handlers
// ============================================================

TEST_F(RegistryTest, HandlerCanStopServerOnThePublishingThread) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  bus_.subscribe<events::ServerStateChanged>([&](const events::ServerStateChanged &e) {
    if (e.new_state == "running") {
      EXPECT_TRUE(registry->stop(e.server_id));
    }
  });

  EXPECT_TRUE(registry->start("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Stopped);
  EXPECT_EQ(registry->status_tracker().get_status("fs"), ServerState::Stopped);

  // Delivered in transition order even though stop ran inside a handler
  std::vector<std::string> expected = {"fs:stopped->starting", "fs:starting->running", "fs:running->stopping", "fs:stopping->stopped"};
  EXPECT_EQ(state_changes_, expected);
}

TEST_F(RegistryTest, HandlerCanWaitForLifecycleOnAnotherThread) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  std::atomic<bool> finished{false};
  bus_.subscribe<events::ServerStateChanged>([&](const events::ServerStateChanged &e) {
    if (e.new_state != "running") return;
    auto pending = std::async(std::launch::async, [&] {
      return registry->stop("fs");
    });
    if (pending.wait_for(2s) == std::future_status::ready) {
      finished = pending.get();
    }
  });

  EXPECT_TRUE(registry->start("fs"));
  EXPECT_TRUE(finished.load());
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Stopped);
}

TEST_F(RegistryTest, HandlerCanClearQuarantine) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  registry->error_isolator().quarantine("fs", "bad");
  EXPECT_FALSE(registry->start("fs"));

  bus_.subscribe<events::ServerStateChanged>([&](const events::ServerStateChanged &e) {
    if (e.new_state == "stopped" && e.old_state == "quarantined") {
      EXPECT_TRUE(registry->start(e.server_id));
    }
  });
  ASSERT_TRUE(registry->clear_quarantine("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Running);
}

// ============================================================
// Operator stop during calls
// ============================================================

TEST_F(RegistryTest, StopWithCallsInFlightLeavesCircuitClosed) {
  {
    std::lock_guard<std::mutex> lock(provider_->mutex);
    provider_->hang_methods = {"tools/call"};
  }
  auto registry = make();
  registry->register_server(fake_config("fs", 10s));
  ASSERT_TRUE(registry->start("fs"));

  std::atomic<int> unavailable{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < 3; ++i) {
    callers.emplace_back([&]() {
      try {
        registry->call_tool("fs", "read_file", json::object());
      } catch (const ServerUnavailableError &) {
        ++unavailable;
      } catch (const std::exception &e) {
        ADD_FAILURE() << "unexpected error: " << e.what();
      }
    });
  }
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (provider_->tool_calls.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  ASSERT_EQ(provider_->tool_calls.load(), 3);

  ASSERT_TRUE(registry->stop("fs"));
  for (auto &t : callers) t.join();

  EXPECT_EQ(unavailable.load(), 3);
  EXPECT_EQ(registry->error_isolator().circuit_state("fs"), CircuitState::Closed);
  EXPECT_EQ(registry->error_isolator().get_error_stats("fs").consecutive_errors, 0);
  EXPECT_EQ(registry->error_isolator().get_error_stats("fs").total_errors, 0u);
  // Not retried either
  EXPECT_TRUE(sleeps_.empty());

  {
    std::lock_guard<std::mutex> lock(provider_->mutex);
    provider_->hang_methods.clear();
  }
  ASSERT_TRUE(registry->start("fs"));
  EXPECT_EQ(registry->call_tool("fs", "read_file", json::object()).text(), "ok");
}

// ============================================================
// Tool calls through the pipeline
// ============================================================

TEST_F(RegistryTest, CallToolAndListTools) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  auto result = registry->call_tool("fs", "read_file", json{{"path", "/tmp/x"}});
  EXPECT_EQ(result.text(), "ok");

  auto tools = registry->list_tools("fs");
  EXPECT_EQ(tools.size(), 2u);

  auto stats = registry->retry_manager().get_retry_stats("fs");
  EXPECT_EQ(stats.successful_calls, 1u);
}

TEST_F(RegistryTest, CallOnStoppedServerIsRejectedWithoutCounting) {
  auto registry = make();
  registry->register_server(fake_config("fs"));

  EXPECT_THROW(registry->call_tool("fs", "read_file", json::object()), ServerUnavailableError);
  EXPECT_EQ(registry->error_isolator().get_error_stats("fs").total_errors, 0u);
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RegistryTest, TransientFailuresAreRetried) {
  std::atomic<int> calls{0};
  provider_->set_handler([&](const JsonRpcRequest &req) {
    if (++calls < 3) return error_response(req, -32010, "503 Service Unavailable");
    return ok_response(req, text_result("finally"));
  });
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  // Two failures stay under the breaker threshold
  auto result = registry->call_tool("fs", "read_file", json::object());
  EXPECT_EQ(result.text(), "finally");
  EXPECT_EQ(calls.load(), 3);
  EXPECT_EQ(sleeps_.size(), 2u);

  auto stats = registry->retry_manager().get_retry_stats("fs");
  EXPECT_EQ(stats.total_attempts, 3u);
  EXPECT_EQ(registry->error_isolator().get_error_stats("fs").consecutive_errors, 0);
  EXPECT_EQ(registry->error_isolator().circuit_state("fs"), CircuitState::Closed);
}

TEST_F(RegistryTest, ProtocolErrorsAreNotRetried) {
  provider_->set_handler([](const JsonRpcRequest &req) {
    return error_response(req, -32602, "Invalid params");
  });
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  EXPECT_THROW(registry->call_tool("fs", "read_file", json::object()), ProtocolError);
  EXPECT_EQ(provider_->tool_calls.load(), 1);
  EXPECT_EQ(registry->error_isolator().get_error_stats("fs").consecutive_errors, 1);
}

TEST_F(RegistryTest, OpenCircuitStopsRetriesAndRejectsCalls) {
  provider_->set_handler([](const JsonRpcRequest &req) {
    return error_response(req, -32010, "503 Service Unavailable");
  });
  auto opts = options();
  opts.settings.retry.max_attempts = 5;
  auto registry = make(std::move(opts));
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  // Third failure opens the breaker; no retry after that
  EXPECT_THROW(registry->call_tool("fs", "read_file", json::object()), McpError);
  EXPECT_EQ(provider_->tool_calls.load(), 3);
  EXPECT_EQ(registry->error_isolator().circuit_state("fs"), CircuitState::Open);

  EXPECT_THROW(registry->call_tool("fs", "read_file", json::object()), CircuitOpenError);
  EXPECT_EQ(provider_->tool_calls.load(), 3);
  EXPECT_EQ(registry->list()[0].circuit, CircuitState::Open);

  // After the cooldown a single trial call goes through and closes the circuit
  provider_->set_handler([](const JsonRpcRequest &req) {
    return ok_response(req, text_result("recovered"));
  });
  *now_ += 30s;
  EXPECT_EQ(registry->call_tool("fs", "read_file", json::object()).text(), "recovered");
  EXPECT_EQ(registry->error_isolator().circuit_state("fs"), CircuitState::Closed);
}

TEST_F(RegistryTest, FatalErrorQuarantines) {
  provider_->set_handler([](const JsonRpcRequest &req) {
    return error_response(req, -32010, "subscription cancelled", json{{"fatal", true}});
  });
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  EXPECT_THROW(registry->call_tool("fs", "read_file", json::object()), FatalServerError);

  auto server = registry->get("fs");
  EXPECT_EQ(server->state(), ServerState::Quarantined);
  EXPECT_TRUE(registry->error_isolator().is_quarantined("fs"));
  EXPECT_TRUE(has_event(registry->get_events("fs"), "quarantined"));
  ASSERT_EQ(quarantined_.size(), 1u);
  EXPECT_EQ(quarantined_[0], "fs");

  // Further calls never reach the provider
  EXPECT_THROW(registry->call_tool("fs", "read_file", json::object()), McpError);
  EXPECT_EQ(provider_->tool_calls.load(), 1);

  auto rows = registry->list();
  EXPECT_TRUE(rows[0].quarantined);
  EXPECT_EQ(rows[0].state, ServerState::Quarantined);
}

TEST_F(RegistryTest, QuarantinedServerCannotStartUntilCleared) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  registry->error_isolator().quarantine("fs", "operator says no");

  EXPECT_FALSE(registry->start("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Quarantined);
  auto events = registry->get_events("fs");
  ASSERT_TRUE(has_event(events, "start_blocked"));
  EXPECT_EQ(events.back().details["reason"], "operator says no");
  EXPECT_EQ(provider_->created.load(), 0);

  // start_all reports it as a failure
  auto results = registry->start_all();
  EXPECT_FALSE(results.at("fs"));

  ASSERT_TRUE(registry->clear_quarantine("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Stopped);
  EXPECT_TRUE(has_event(registry->get_events("fs"), "quarantine_cleared"));

  ASSERT_TRUE(registry->start("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Running);
}

TEST_F(RegistryTest, QuarantineSurvivesReload) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  registry->error_isolator().quarantine("fs", "bad");

  ASSERT_TRUE(registry->reload("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Quarantined);
  EXPECT_FALSE(registry->start("fs"));
}

TEST_F(RegistryTest, ClearingOnTheIsolatorAlsoReleasesTheServer) {
  auto registry = make();
  registry->register_server(fake_config("fs"));
  registry->error_isolator().quarantine("fs", "bad");
  EXPECT_FALSE(registry->start("fs"));
  ASSERT_EQ(registry->get("fs")->state(), ServerState::Quarantined);

  registry->error_isolator().clear_quarantine("fs");

  ASSERT_TRUE(registry->start("fs"));
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Running);
  EXPECT_TRUE(has_event(registry->get_events("fs"), "quarantine_cleared"));
}

TEST_F(RegistryTest, RepeatedFailuresEventuallyQuarantine) {
  provider_->set_handler([](const JsonRpcRequest &req) {
    return error_response(req, -32603, "parse failure in provider");
  });
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));

  int provider_failures = 0;
  for (int i = 0; i < 40 && !registry->error_isolator().is_quarantined("fs"); ++i) {
    try {
      registry->call_tool("fs", "read_file", json::object());
    } catch (const CircuitOpenError &) {
      *now_ += 10min;
    } catch (const McpError &) {
      ++provider_failures;
    }
  }

  EXPECT_TRUE(registry->error_isolator().is_quarantined("fs"));
  EXPECT_EQ(provider_failures, registry->settings().isolator.quarantine_threshold);
  EXPECT_EQ(registry->get("fs")->state(), ServerState::Quarantined);
}

TEST_F(RegistryTest, WriteClassCallsAreSerializedAcrossServers) {
  std::atomic<int> current{0};
  std::atomic<int> peak{0};
  provider_->set_handler([&](const JsonRpcRequest &req) {
    int now = ++current;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(20ms);
    --current;
    return ok_response(req, text_result("done"));
  });
  auto registry = make();
  registry->register_server(fake_config("a"));
  registry->register_server(fake_config("b"));
  ASSERT_TRUE(registry->start("a"));
  ASSERT_TRUE(registry->start("b"));

  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i]() {
      registry->call_tool(i % 2 ? "a" : "b", "edit_file", json::object());
    });
  }
  for (auto &t : threads) t.join();
  EXPECT_EQ(peak.load(), 1);

  peak = 0;
  threads.clear();
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&, i]() {
      registry->call_tool(i % 2 ? "a" : "b", "read_file", json::object());
    });
  }
  for (auto &t : threads) t.join();
  EXPECT_GT(peak.load(), 1);
}

// ============================================================
// Observability
// ============================================================

TEST_F(RegistryTest, ServerStatusJson) {
  provider_->stderr_on_connect = {"ready"};
  auto registry = make();
  registry->register_server(fake_config("fs"));
  ASSERT_TRUE(registry->start("fs"));
  registry->call_tool("fs", "read_file", json::object());

  auto status = registry->get_server_status("fs");
  EXPECT_EQ(status["exists"], true);
  EXPECT_EQ(status["state"], "running");
  EXPECT_EQ(status["tracker"]["state"], "running");
  EXPECT_EQ(status["errors"]["total_errors"], 0);
  EXPECT_EQ(status["retries"]["successful_calls"], 1);
  EXPECT_LE(status["recent_events"].size(), 5u);
  EXPECT_FALSE(status["recent_events"].empty());

  auto missing = registry->get_server_status("ghost");
  EXPECT_EQ(missing["exists"], false);

  auto summary = registry->get_server_summary("fs");
  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->state, ServerState::Running);

  auto lines = registry->get_captured_diagnostics("fs");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "ready");
}

TEST_F(RegistryTest, CleanupAppliesRetention) {
  auto opts = options();
  opts.settings.event_retention_days = 1;
  auto now = std::make_shared<std::chrono::system_clock::time_point>(std::chrono::system_clock::now());
  opts.wall_clock = [now] { return *now; };
  auto registry = make(std::move(opts));
  registry->register_server(fake_config("fs"));

  *now += std::chrono::hours(48);
  registry->cleanup_old_data();
  EXPECT_TRUE(registry->get_events("fs").empty());
}
