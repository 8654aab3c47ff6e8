#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

#include <gtest/gtest.h>

#include "conductor/config/config_store.h"
#include "conductor/logging/logger_registry.h"
#include "conductor/manager/service_manager.h"
#include "../mocks/capturing_sink.h"
#include "../mocks/transport_mocks.h"

namespace conductor {
namespace manager {
namespace {

namespace fs = std::filesystem;

using json::JsonObjectBuilder;
using json::JsonValue;
using test::FakeServiceBehavior;
using test::FakeServiceRegistry;
using test::makeDescriptor;

class ServiceManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("conductor_manager_test_" + std::to_string(::getpid()));
    fs::remove_all(dir_);

    registry_ = std::make_shared<FakeServiceRegistry>();

    config_.config_path = (dir_ / "mcp_services.json").string();
    config_.health_check_interval = std::chrono::hours(1);
    config_.restart_delay = std::chrono::milliseconds(1);

    auto& logs = logging::LoggerRegistry::instance();
    previous_sink_ = logs.getDefaultSink();
    sink_ = std::make_shared<test::CapturingSink>();
    logs.setDefaultSink(sink_);
  }

  void TearDown() override {
    manager_.reset();
    logging::LoggerRegistry::instance().setDefaultSink(previous_sink_);
    fs::remove_all(dir_);
  }

  ServiceManager& manager() {
    if (!manager_) {
      manager_ = std::make_unique<ServiceManager>(config_, registry_);
    }
    return *manager_;
  }

  std::string firstText(const Result<JsonValue>& result) {
    return valueOf(result)["content"][0]["text"].getString();
  }

  fs::path dir_;
  ManagerConfig config_;
  std::shared_ptr<FakeServiceRegistry> registry_;
  std::unique_ptr<ServiceManager> manager_;
  std::shared_ptr<test::CapturingSink> sink_;
  std::shared_ptr<logging::LogSink> previous_sink_;
};

TEST_F(ServiceManagerTest, RegisterAutoStartsAndRoutesCalls) {
  registry_->define("alpha", FakeServiceBehavior{{"echo", "sum"}});

  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));
  EXPECT_EQ(manager().getActiveServers(), std::vector<std::string>{"alpha"});
  EXPECT_EQ(manager().listTools().size(), 2u);

  auto result = manager().callTool(
      "sum", JsonObjectBuilder().add("a", 1).build());
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(firstText(result), "alpha:sum");
  EXPECT_EQ(registry_->counters("alpha")->tool_calls.load(), 1);
}

TEST_F(ServiceManagerTest, RegisterWithoutAutoStartStaysStopped) {
  registry_->define("alpha", FakeServiceBehavior{});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha", false)));

  EXPECT_TRUE(manager().getActiveServers().empty());
  EXPECT_EQ(manager().getServiceIds(), std::vector<std::string>{"alpha"});
  EXPECT_EQ(registry_->counters("alpha")->connects.load(), 0);

  JsonValue status = manager().getServiceStatus(std::string("alpha"));
  EXPECT_EQ(status["status"].getString(), "stopped");
}

TEST_F(ServiceManagerTest, InvalidDescriptorIsRejected) {
  config::ServiceDescriptor bad = makeDescriptor("");
  EXPECT_FALSE(manager().registerService(bad));
  EXPECT_TRUE(manager().getServiceIds().empty());
  EXPECT_EQ(manager().getManagerStats().services_registered, 0);
}

TEST_F(ServiceManagerTest, FailedAutoStartStillRegisters) {
  FakeServiceBehavior refusing;
  refusing.refuse_connect = true;
  registry_->define("alpha", refusing);

  EXPECT_TRUE(manager().registerService(makeDescriptor("alpha")));
  JsonValue status = manager().getServiceStatus(std::string("alpha"));
  EXPECT_EQ(status["status"].getString(), "error");
  EXPECT_NE(status["error"].getString("").find("connection refused"),
            std::string::npos);
  EXPECT_EQ(manager().getManagerStats().services_running, 0);
}

TEST_F(ServiceManagerTest, LastStartedServiceWinsContestedTool) {
  registry_->define("alpha", FakeServiceBehavior{{"search", "only_alpha"}});
  registry_->define("beta", FakeServiceBehavior{{"search"}});

  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));
  ASSERT_TRUE(manager().registerService(makeDescriptor("beta")));

  auto routed = manager().callTool("search", JsonValue::object());
  ASSERT_FALSE(isError(routed));
  EXPECT_EQ(firstText(routed), "beta:search");
  EXPECT_EQ(registry_->counters("alpha")->tool_calls.load(), 0);
  EXPECT_EQ(sink_->count("manager", "now routed to this service"), 1u);

  // Stopping the loser leaves the winner's entry in place
  ASSERT_TRUE(manager().stopService("alpha"));
  routed = manager().callTool("search", JsonValue::object());
  ASSERT_FALSE(isError(routed));
  EXPECT_EQ(firstText(routed), "beta:search");
  EXPECT_TRUE(isError(manager().callTool("only_alpha", JsonValue::object())));
}

TEST_F(ServiceManagerTest, UnknownToolCountsAsError) {
  auto result = manager().callTool("nope", JsonValue::object());
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(errorOf(result).code, ErrorCode::ToolNotFound);
  EXPECT_EQ(errorOf(result).message, "Tool nope not found");

  ManagerStats stats = manager().getManagerStats();
  EXPECT_EQ(stats.errors, 1);
  EXPECT_EQ(stats.requests_processed, 0);
}

TEST_F(ServiceManagerTest, TimedOutCallKeepsServiceRunning) {
  FakeServiceBehavior hanging;
  hanging.hang_calls = true;
  registry_->define("slow", hanging);
  ASSERT_TRUE(manager().registerService(makeDescriptor("slow")));

  auto result = manager().callTool("echo", JsonValue::object(),
                                   std::chrono::milliseconds(10));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(errorOf(result).code, ErrorCode::ToolCallTimeout);
  EXPECT_EQ(manager().getActiveServers(), std::vector<std::string>{"slow"});
  EXPECT_EQ(manager().getManagerStats().errors, 1);
}

TEST_F(ServiceManagerTest, StopIsIdempotent) {
  registry_->define("alpha", FakeServiceBehavior{});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));

  EXPECT_TRUE(manager().stopService("alpha"));
  EXPECT_TRUE(manager().stopService("alpha"));
  EXPECT_TRUE(manager().listTools().empty());
  EXPECT_FALSE(manager().stopService("missing"));
  EXPECT_FALSE(manager().startService("missing"));
}

TEST_F(ServiceManagerTest, RestartReconnects) {
  registry_->define("alpha", FakeServiceBehavior{});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));
  ASSERT_TRUE(manager().restartService("alpha"));

  EXPECT_EQ(registry_->counters("alpha")->connects.load(), 2);
  EXPECT_EQ(manager().getActiveServers(), std::vector<std::string>{"alpha"});
  EXPECT_FALSE(manager().restartService("missing"));
}

TEST_F(ServiceManagerTest, UnregisterRemovesServiceAndTools) {
  registry_->define("alpha", FakeServiceBehavior{});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));
  ASSERT_TRUE(manager().unregisterService("alpha"));

  EXPECT_TRUE(manager().getServiceIds().empty());
  EXPECT_TRUE(manager().listTools().empty());
  EXPECT_FALSE(manager().unregisterService("alpha"));

  JsonValue status = manager().getServiceStatus(std::string("alpha"));
  EXPECT_EQ(status["error"].getString(), "Service alpha not found");
}

TEST_F(ServiceManagerTest, ReRegisterReplacesPreviousClient) {
  registry_->define("alpha", FakeServiceBehavior{{"old"}});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));

  registry_->update("alpha", [](FakeServiceBehavior& b) { b.tools = {"new"}; });
  config::ServiceDescriptor replacement = makeDescriptor("alpha");
  replacement.name = "Alpha v2";
  ASSERT_TRUE(manager().registerService(replacement));

  EXPECT_EQ(manager().getServiceIds().size(), 1u);
  auto tools = manager().listTools(std::string("alpha"));
  ASSERT_EQ(tools.size(), 1u);
  EXPECT_EQ(tools[0].name, "new");
  EXPECT_EQ(manager().getManagerStats().services_registered, 2);
  EXPECT_EQ(manager().getServiceStatus(std::string("alpha"))["name"]
                .getString(),
            "Alpha v2");
}

TEST_F(ServiceManagerTest, StatsReflectActivity) {
  registry_->define("alpha", FakeServiceBehavior{{"a", "b"}});
  registry_->define("beta", FakeServiceBehavior{{"c"}});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));
  ASSERT_TRUE(manager().registerService(makeDescriptor("beta", false)));

  EXPECT_FALSE(isError(manager().callTool("a", JsonValue::object())));
  EXPECT_FALSE(isError(manager().callTool("b", JsonValue::object())));
  EXPECT_TRUE(isError(manager().callTool("c", JsonValue::object())));

  ManagerStats stats = manager().getManagerStats();
  EXPECT_EQ(stats.services_registered, 2);
  EXPECT_EQ(stats.services_running, 1);
  EXPECT_EQ(stats.tools_available, 2);
  EXPECT_EQ(stats.requests_processed, 2);
  EXPECT_EQ(stats.errors, 1);

  JsonValue json = stats.toJson();
  EXPECT_EQ(json["requests_processed"].getInt64(), 2);
  std::string ts = json["timestamp"].getString();
  ASSERT_EQ(ts.size(), 26u);
  EXPECT_EQ(ts[10], 'T');
  EXPECT_EQ(ts[19], '.');
}

TEST_F(ServiceManagerTest, StatusForAllServices) {
  registry_->define("alpha", FakeServiceBehavior{});
  registry_->define("beta", FakeServiceBehavior{});
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));
  ASSERT_TRUE(manager().registerService(makeDescriptor("beta", false)));

  JsonValue all = manager().getServiceStatus();
  ASSERT_TRUE(all.isObject());
  EXPECT_EQ(all.size(), 2u);
  EXPECT_EQ(all["alpha"]["status"].getString(), "running");
  EXPECT_EQ(all["beta"]["status"].getString(), "stopped");
}

TEST_F(ServiceManagerTest, HealthCheckRestartsUpToMaxRetries) {
  FakeServiceBehavior flaky;
  flaky.list_failures_after = 1;  // the list made by connect succeeds
  registry_->define("flaky", flaky);

  config::ServiceDescriptor descriptor = makeDescriptor("flaky");
  descriptor.max_retries = 2;
  ASSERT_TRUE(manager().registerService(descriptor));
  auto counters = registry_->counters("flaky");
  ASSERT_EQ(counters->connects.load(), 1);

  manager().runHealthCheck();
  EXPECT_EQ(counters->connects.load(), 2);
  EXPECT_EQ(manager().getActiveServers().size(), 1u);

  manager().runHealthCheck();
  EXPECT_EQ(counters->connects.load(), 3);

  // Retries exhausted: the service stays in error and is not restarted
  manager().runHealthCheck();
  EXPECT_EQ(counters->connects.load(), 3);
  EXPECT_TRUE(manager().getActiveServers().empty());
  EXPECT_EQ(manager().getServiceStatus(std::string("flaky"))["status"]
                .getString(),
            "error");
  EXPECT_EQ(manager().getManagerStats().services_running, 0);
  EXPECT_TRUE(manager().listTools().empty());

  manager().runHealthCheck();
  EXPECT_EQ(counters->connects.load(), 3);
  EXPECT_EQ(sink_->count("manager", "giving up"), 1u);
}

TEST_F(ServiceManagerTest, HealthCheckLeavesNoRestartServicesInError) {
  FakeServiceBehavior flaky;
  flaky.list_failures_after = 1;
  registry_->define("flaky", flaky);

  config::ServiceDescriptor descriptor = makeDescriptor("flaky");
  descriptor.restart_on_failure = false;
  ASSERT_TRUE(manager().registerService(descriptor));

  manager().runHealthCheck();
  EXPECT_EQ(registry_->counters("flaky")->connects.load(), 1);
  EXPECT_TRUE(manager().getActiveServers().empty());
}

TEST_F(ServiceManagerTest, SuccessfulProbeCanResetRetries) {
  config_.reset_retries_on_success = true;
  FakeServiceBehavior flaky;
  flaky.list_failures_after = 1;
  registry_->define("flaky", flaky);

  config::ServiceDescriptor descriptor = makeDescriptor("flaky");
  descriptor.max_retries = 1;
  ASSERT_TRUE(manager().registerService(descriptor));

  manager().runHealthCheck();  // fails, restart 1 of 1
  registry_->update("flaky",
                    [](FakeServiceBehavior& b) { b.list_failures_after = -1; });
  manager().runHealthCheck();  // succeeds, retries back to zero
  registry_->update("flaky",
                    [](FakeServiceBehavior& b) { b.list_failures_after = 1; });
  manager().runHealthCheck();  // fails again, restart allowed

  EXPECT_EQ(registry_->counters("flaky")->connects.load(), 3);
  EXPECT_EQ(manager().getActiveServers().size(), 1u);
}

TEST_F(ServiceManagerTest, HealthMonitorRunsChecksPeriodically) {
  config_.health_check_interval = std::chrono::milliseconds(20);
  config_.create_default_config = false;
  registry_->define("alpha", FakeServiceBehavior{});
  ASSERT_TRUE(manager().initialize());
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));

  auto counters = registry_->counters("alpha");
  int before = counters->requests.load();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (counters->requests.load() < before + 2 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_GE(counters->requests.load(), before + 2);
}

TEST_F(ServiceManagerTest, NoTrafficAfterShutdown) {
  config_.health_check_interval = std::chrono::milliseconds(10);
  config_.create_default_config = false;
  registry_->define("alpha", FakeServiceBehavior{});
  ASSERT_TRUE(manager().initialize());
  ASSERT_TRUE(manager().registerService(makeDescriptor("alpha")));

  manager().shutdown();
  EXPECT_FALSE(manager().isInitialized());
  EXPECT_TRUE(manager().getServiceIds().empty());

  int after = registry_->totalRequests();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  EXPECT_EQ(registry_->totalRequests(), after);

  EXPECT_TRUE(isError(manager().callTool("echo", JsonValue::object())));
  manager().shutdown();
}

TEST_F(ServiceManagerTest, InitializeCreatesDefaultConfig) {
  ASSERT_TRUE(manager().initialize());
  EXPECT_TRUE(fs::exists(config_.config_path));
  EXPECT_TRUE(manager().isInitialized());

  auto ids = manager().getServiceIds();
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids[0], "brave_search");
  EXPECT_EQ(ids[1], "filesystem");
  EXPECT_TRUE(manager().getActiveServers().empty());

  // A second call is a no-op
  EXPECT_TRUE(manager().initialize());
}

TEST_F(ServiceManagerTest, InitializeStartsAutoStartServices) {
  config::ServiceConfigFile file;
  file.services.push_back(makeDescriptor("alpha"));
  file.services.push_back(makeDescriptor("beta", false));
  config::ConfigStore(config_.config_path).save(file);

  registry_->define("alpha", FakeServiceBehavior{});
  registry_->define("beta", FakeServiceBehavior{});
  ASSERT_TRUE(manager().initialize());

  EXPECT_EQ(manager().getActiveServers(), std::vector<std::string>{"alpha"});
  EXPECT_EQ(registry_->counters("beta")->connects.load(), 0);

  ASSERT_TRUE(manager().stopAllServers());
  EXPECT_TRUE(manager().getActiveServers().empty());
  ASSERT_TRUE(manager().startDefaultServers());
  EXPECT_EQ(manager().getActiveServers(), std::vector<std::string>{"alpha"});
}

TEST_F(ServiceManagerTest, InitializeFailsOnMalformedConfig) {
  fs::create_directories(dir_);
  std::ofstream(config_.config_path) << "{ \"services\": [ {\"id\": ";
  EXPECT_FALSE(manager().initialize());
  EXPECT_FALSE(manager().isInitialized());
}

TEST_F(ServiceManagerTest, SaveConfigWritesRegisteredServices) {
  registry_->define("alpha", FakeServiceBehavior{});
  config::ServiceDescriptor descriptor = makeDescriptor("alpha", false);
  descriptor.args = std::vector<std::string>{"--verbose"};
  ASSERT_TRUE(manager().registerService(descriptor));
  ASSERT_TRUE(manager().saveConfig());

  auto loaded = config::ConfigStore(config_.config_path).load();
  ASSERT_EQ(loaded.services.size(), 1u);
  EXPECT_EQ(loaded.services[0], descriptor);
}

TEST_F(ServiceManagerTest, DiscoverServicesListsKnownServers) {
  EXPECT_EQ(manager().discoverServices().size(), 4u);
}

TEST(ManagerConfigTest, DefaultPathUsesXdgConfigHome) {
  const char* saved = std::getenv("XDG_CONFIG_HOME");
  std::string previous = saved ? saved : "";

  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  EXPECT_EQ(ManagerConfig::defaultConfigPath(),
            "/tmp/xdg/conductor/mcp_services.json");

  if (saved) {
    ::setenv("XDG_CONFIG_HOME", previous.c_str(), 1);
  } else {
    ::unsetenv("XDG_CONFIG_HOME");
  }
}

}  // namespace
}  // namespace manager
}  // namespace conductor
