#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "conductor/client/service_client.h"
#include "../mocks/transport_mocks.h"

namespace conductor {
namespace client {
namespace {

using json::JsonObjectBuilder;
using json::JsonValue;
using test::FakeServiceBehavior;
using test::FakeServiceRegistry;
using test::MockTransport;
using test::SingleTransportFactory;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

// Answers the handshake and tools/list; tools/call is left to each test
void expectHandshake(MockTransport& transport,
                     const std::vector<std::string>& tools) {
  ON_CALL(transport, connect(_)).WillByDefault(Return(makeVoidSuccess()));
  ON_CALL(transport, isConnected()).WillByDefault(Return(true));
  ON_CALL(transport, protocol()).WillByDefault(Return("mock"));
  ON_CALL(transport, sendNotification(_))
      .WillByDefault(Return(makeVoidSuccess()));
  ON_CALL(transport, sendRequest(_, _))
      .WillByDefault(Invoke([tools](const JsonValue& request,
                                    std::chrono::milliseconds)
                                -> Result<JsonValue> {
        std::string method = request["method"].getString("");
        if (method == protocol::methods::kInitialize) {
          return test::makeResponse(request, test::initializeResult());
        }
        if (method == protocol::methods::kToolsList) {
          return test::makeResponse(request, test::toolListResult(tools));
        }
        return test::makeErrorResponse(request, -32601, "Method not found");
      }));
}

class ServiceClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = std::make_shared<FakeServiceRegistry>();
    registry_->define("alpha", FakeServiceBehavior{});
  }

  std::shared_ptr<FakeServiceRegistry> registry_;
};

TEST_F(ServiceClientTest, StatusNames) {
  EXPECT_STREQ(serviceStatusToString(ServiceStatus::Stopped), "stopped");
  EXPECT_STREQ(serviceStatusToString(ServiceStatus::Starting), "starting");
  EXPECT_STREQ(serviceStatusToString(ServiceStatus::Running), "running");
  EXPECT_STREQ(serviceStatusToString(ServiceStatus::Stopping), "stopping");
  EXPECT_STREQ(serviceStatusToString(ServiceStatus::Error), "error");
}

TEST_F(ServiceClientTest, ConnectWalksStatesAndCachesTools) {
  registry_->update("alpha", [](FakeServiceBehavior& b) {
    b.tools = {"echo", "reverse"};
  });
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);

  std::vector<std::pair<ServiceStatus, ServiceStatus>> transitions;
  client.setStatusCallback([&](const std::string& id, ServiceStatus from,
                               ServiceStatus to) {
    EXPECT_EQ(id, "alpha");
    transitions.emplace_back(from, to);
  });

  EXPECT_EQ(client.status(), ServiceStatus::Stopped);
  ASSERT_TRUE(client.connect());
  EXPECT_EQ(client.status(), ServiceStatus::Running);
  EXPECT_FALSE(client.lastError().has_value());
  EXPECT_TRUE(client.hasTool("echo"));
  EXPECT_TRUE(client.hasTool("reverse"));
  EXPECT_EQ(client.tools().size(), 2u);
  EXPECT_EQ(registry_->counters("alpha")->notifications.load(), 1);

  client.disconnect();
  EXPECT_EQ(client.status(), ServiceStatus::Stopped);
  EXPECT_TRUE(client.tools().empty());

  ASSERT_EQ(transitions.size(), 4u);
  EXPECT_EQ(transitions[0].second, ServiceStatus::Starting);
  EXPECT_EQ(transitions[1].second, ServiceStatus::Running);
  EXPECT_EQ(transitions[2].second, ServiceStatus::Stopping);
  EXPECT_EQ(transitions[3].second, ServiceStatus::Stopped);
}

TEST_F(ServiceClientTest, ConnectWhenRunningIsNoOp) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);
  ASSERT_TRUE(client.connect());
  ASSERT_TRUE(client.connect());
  EXPECT_EQ(registry_->counters("alpha")->connects.load(), 1);
}

TEST_F(ServiceClientTest, RefusedConnectEndsInError) {
  registry_->update("alpha",
                    [](FakeServiceBehavior& b) { b.refuse_connect = true; });
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);

  EXPECT_FALSE(client.connect());
  EXPECT_EQ(client.status(), ServiceStatus::Error);
  ASSERT_TRUE(client.lastError().has_value());
  EXPECT_NE(client.lastError()->find("connection refused"),
            std::string::npos);

  // Error -> Starting is allowed once the service recovers
  registry_->update("alpha",
                    [](FakeServiceBehavior& b) { b.refuse_connect = false; });
  EXPECT_TRUE(client.connect());
  EXPECT_EQ(client.status(), ServiceStatus::Running);
  EXPECT_FALSE(client.lastError().has_value());
}

TEST_F(ServiceClientTest, MissingTransportEndsInError) {
  SingleTransportFactory factory(nullptr);
  ServiceClient client(test::makeDescriptor("alpha"), factory);
  EXPECT_FALSE(client.connect());
  EXPECT_EQ(client.status(), ServiceStatus::Error);
}

TEST_F(ServiceClientTest, CallToolReturnsResult) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);
  ASSERT_TRUE(client.connect());

  auto result = client.callTool(
      "echo", JsonObjectBuilder().add("text", "hi").build());
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(valueOf(result)["content"][0]["text"].getString(), "alpha:echo");
}

TEST_F(ServiceClientTest, CallToolBeforeConnectIsNotRunning) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);
  auto result = client.callTool("echo", JsonValue::object());
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(errorOf(result).code, ErrorCode::ServiceNotRunning);
}

TEST_F(ServiceClientTest, UnknownToolFailsWithoutTransportTraffic) {
  auto mock = std::make_unique<NiceMock<MockTransport>>();
  expectHandshake(*mock, {"echo"});
  MockTransport* transport = mock.get();
  SingleTransportFactory factory(std::move(mock));

  ServiceClient client(test::makeDescriptor("alpha"), factory);
  ASSERT_TRUE(client.connect());

  EXPECT_CALL(*transport, sendRequest(_, _)).Times(0);
  auto result = client.callTool("missing", JsonValue::object());
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(errorOf(result).code, ErrorCode::ToolNotFound);
  EXPECT_EQ(client.status(), ServiceStatus::Running);
}

TEST_F(ServiceClientTest, TimeoutLeavesServiceRunning) {
  auto mock = std::make_unique<NiceMock<MockTransport>>();
  expectHandshake(*mock, {"slow"});
  MockTransport* transport = mock.get();
  SingleTransportFactory factory(std::move(mock));

  ServiceClient client(test::makeDescriptor("alpha"), factory);
  ASSERT_TRUE(client.connect());

  EXPECT_CALL(*transport,
              sendRequest(_, std::chrono::milliseconds(10)))
      .WillOnce(Return(makeError<JsonValue>(ErrorCode::TransportTimeout,
                                            "deadline passed")));
  auto result = client.callTool("slow", JsonValue::object(),
                                std::chrono::milliseconds(10));
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(errorOf(result).code, ErrorCode::ToolCallTimeout);
  EXPECT_EQ(client.status(), ServiceStatus::Running);
}

TEST_F(ServiceClientTest, DefaultTimeoutComesFromDescriptor) {
  auto mock = std::make_unique<NiceMock<MockTransport>>();
  expectHandshake(*mock, {"echo"});
  MockTransport* transport = mock.get();
  SingleTransportFactory factory(std::move(mock));

  config::ServiceDescriptor descriptor = test::makeDescriptor("alpha");
  descriptor.timeout = 7;
  ServiceClient client(descriptor, factory);
  ASSERT_TRUE(client.connect());

  EXPECT_CALL(*transport, sendRequest(_, std::chrono::milliseconds(7000)))
      .WillOnce(Invoke([](const JsonValue& request,
                          std::chrono::milliseconds) -> Result<JsonValue> {
        return test::makeResponse(request, JsonValue::object());
      }));
  EXPECT_FALSE(isError(client.callTool("echo", JsonValue::object())));
}

TEST_F(ServiceClientTest, ServerErrorBecomesToolCallError) {
  auto mock = std::make_unique<NiceMock<MockTransport>>();
  expectHandshake(*mock, {"echo"});
  MockTransport* transport = mock.get();
  SingleTransportFactory factory(std::move(mock));

  ServiceClient client(test::makeDescriptor("alpha"), factory);
  ASSERT_TRUE(client.connect());

  EXPECT_CALL(*transport, sendRequest(_, _))
      .WillOnce(Invoke([](const JsonValue& request,
                          std::chrono::milliseconds) -> Result<JsonValue> {
        return test::makeErrorResponse(request, -32602, "Invalid params");
      }));
  auto result = client.callTool("echo", JsonValue::object());
  ASSERT_TRUE(isError(result));
  const Error& error = errorOf(result);
  EXPECT_EQ(error.code, ErrorCode::ToolCallError);
  ASSERT_TRUE(error.data.has_value());
  EXPECT_EQ((*error.data)["code"].getInt(), -32602);
  EXPECT_EQ(client.status(), ServiceStatus::Running);
}

TEST_F(ServiceClientTest, ListToolsRefreshesCache) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);
  ASSERT_TRUE(client.connect());
  EXPECT_FALSE(client.hasTool("added"));

  registry_->update("alpha", [](FakeServiceBehavior& b) {
    b.tools = {"added"};
  });
  auto tools = client.listTools();
  ASSERT_FALSE(isError(tools));
  ASSERT_EQ(valueOf(tools).size(), 1u);
  EXPECT_EQ(valueOf(tools)[0].service_id, "alpha");
  EXPECT_TRUE(client.hasTool("added"));
  EXPECT_FALSE(client.hasTool("echo"));
}

TEST_F(ServiceClientTest, ServiceInfoWhenStoppedAndRunning) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);

  JsonValue stopped = client.getServiceInfo();
  EXPECT_EQ(stopped["service_id"].getString(), "alpha");
  EXPECT_EQ(stopped["status"].getString(), "stopped");
  EXPECT_TRUE(stopped["error"].isNull());

  ASSERT_TRUE(client.connect());
  JsonValue running = client.getServiceInfo();
  EXPECT_EQ(running["status"].getString(), "running");
  EXPECT_EQ(running["protocol_version"].getString(),
            protocol::kProtocolVersion);
  EXPECT_EQ(running["server_info"]["name"].getString(), "fake");
  EXPECT_EQ(running["tools_count"].getInt(), 1);
}

TEST_F(ServiceClientTest, MarkErrorAndRetryCounter) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);
  ASSERT_TRUE(client.connect());

  client.markError("probe failed");
  EXPECT_EQ(client.status(), ServiceStatus::Error);
  EXPECT_EQ(client.lastError().value_or(""), "probe failed");

  EXPECT_EQ(client.retryCount(), 0);
  client.incrementRetryCount();
  client.incrementRetryCount();
  EXPECT_EQ(client.retryCount(), 2);
  client.resetRetryCount();
  EXPECT_EQ(client.retryCount(), 0);

  client.disconnect();
  EXPECT_EQ(client.status(), ServiceStatus::Stopped);
}

TEST_F(ServiceClientTest, DisconnectWhenStoppedDoesNothing) {
  ServiceClient client(test::makeDescriptor("alpha"), *registry_);
  int calls = 0;
  client.setStatusCallback(
      [&](const std::string&, ServiceStatus, ServiceStatus) { ++calls; });
  client.disconnect();
  EXPECT_EQ(calls, 0);
}

}  // namespace
}  // namespace client
}  // namespace conductor
