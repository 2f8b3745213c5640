// Broker Admin Server Unit Tests
//
// Tests cover:
// - All gRPC handlers
// - Input validation
// - Error handling with gRPC status codes
// - Paging defaults
// - Record to protobuf conversion

#include "admin_server.h"

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace broker_admin {
namespace {

using namespace std::chrono_literals;

// =============================================================================
// Fake Session Controller
// =============================================================================

class FakeSessionController : public SessionController {
 public:
  void TerminateSession(const std::string& client_id) override {
    terminated.push_back(client_id);
  }

  bool CloseConnection(const std::string& client_id) override {
    closed.push_back(client_id);
    return true;
  }

  std::vector<std::string> terminated;
  std::vector<std::string> closed;
};

ConnectionInfo MakeConnection(const std::string& client_id) {
  ConnectionInfo connection;
  connection.client_id = client_id;
  connection.username = "admin";
  connection.protocol_version = 5;
  connection.local_addr = "127.0.0.1:1883";
  connection.remote_addr = "192.168.1.20:50000";
  connection.keep_alive = 30;
  connection.session_expiry = 120;
  connection.max_inflight = 16;
  connection.max_queued = 100;
  connection.receive_maximum = 20;
  connection.connected_at =
      std::chrono::system_clock::time_point(1700000000s + 250ms);
  return connection;
}

// =============================================================================
// Test Fixture
// =============================================================================

class AdminServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<FakeClock>();
    clock_->SetTime(std::chrono::system_clock::time_point(1700000100s));
    clients_ = std::make_unique<ClientRegistry>(&stats_, clock_);

    PageDefaults defaults;
    defaults.default_page_size = 2;
    defaults.max_page_size = 3;
    client_service_ = std::make_unique<ClientServiceImpl>(
        clients_.get(), &sessions_, defaults);
    subscription_service_ =
        std::make_unique<SubscriptionServiceImpl>(&subscriptions_, defaults);
  }

  InMemoryStatsSource stats_;
  std::shared_ptr<FakeClock> clock_;
  std::unique_ptr<ClientRegistry> clients_;
  SubscriptionRegistry subscriptions_;
  FakeSessionController sessions_;
  std::unique_ptr<ClientServiceImpl> client_service_;
  std::unique_ptr<SubscriptionServiceImpl> subscription_service_;
};

// =============================================================================
// ClientService.List Tests
// =============================================================================

TEST_F(AdminServerTest, ListClients) {
  clients_->AddClient(MakeConnection("A"));
  clients_->AddClient(MakeConnection("B"));
  clients_->AddClient(MakeConnection("C"));

  ListClientRequest request;
  request.set_page(1);
  request.set_page_size(2);

  ListClientResponse response;
  grpc::Status status = client_service_->List(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  ASSERT_EQ(response.clients_size(), 2);
  EXPECT_EQ(response.clients(0).client_id(), "A");
  EXPECT_EQ(response.clients(1).client_id(), "B");
  EXPECT_EQ(response.total_count(), 3);
}

TEST_F(AdminServerTest, ListClientsAppliesDefaults) {
  clients_->AddClient(MakeConnection("A"));
  clients_->AddClient(MakeConnection("B"));
  clients_->AddClient(MakeConnection("C"));

  ListClientRequest request;  // page = 0, page_size = 0
  ListClientResponse response;
  grpc::Status status = client_service_->List(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(response.clients_size(), 2);  // default_page_size
  EXPECT_EQ(response.total_count(), 3);
}

TEST_F(AdminServerTest, ListClientsCapsPageSize) {
  for (const char* id : {"A", "B", "C", "D", "E"}) {
    clients_->AddClient(MakeConnection(id));
  }

  ListClientRequest request;
  request.set_page(1);
  request.set_page_size(100);
  ListClientResponse response;
  client_service_->List(nullptr, &request, &response);

  EXPECT_EQ(response.clients_size(), 3);  // max_page_size
  EXPECT_EQ(response.total_count(), 5);
}

TEST_F(AdminServerTest, ListClientsPastEnd) {
  clients_->AddClient(MakeConnection("A"));

  ListClientRequest request;
  request.set_page(5);
  request.set_page_size(2);
  ListClientResponse response;
  grpc::Status status = client_service_->List(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(response.clients_size(), 0);
  EXPECT_EQ(response.total_count(), 1);
}

// =============================================================================
// ClientService.Get Tests
// =============================================================================

TEST_F(AdminServerTest, GetClientConvertsRecord) {
  clients_->AddClient(MakeConnection("A"));

  ClientStats stats;
  stats.subscriptions_current = 2;
  stats.subscriptions_total = 5;
  stats.bytes_received = 1000;
  stats.packets_received = 10;
  stats.bytes_sent = 2000;
  stats.packets_sent = 20;
  stats.messages_dropped = 3;
  stats.inflight_current = 4;
  stats.queued_current = 6;
  stats_.Update("A", stats);

  GetClientRequest request;
  request.set_client_id("A");
  GetClientResponse response;
  grpc::Status status = client_service_->Get(nullptr, &request, &response);

  ASSERT_TRUE(status.ok());
  const Client& client = response.client();
  EXPECT_EQ(client.client_id(), "A");
  EXPECT_EQ(client.username(), "admin");
  EXPECT_EQ(client.version(), 5);
  EXPECT_EQ(client.keep_alive(), 30);
  EXPECT_EQ(client.local_addr(), "127.0.0.1:1883");
  EXPECT_EQ(client.remote_addr(), "192.168.1.20:50000");
  EXPECT_EQ(client.session_expiry(), 120);
  EXPECT_EQ(client.max_inflight(), 16);
  EXPECT_EQ(client.max_queue(), 100);
  EXPECT_EQ(client.receive_maximum(), 20);
  EXPECT_EQ(client.connected_at().seconds(), 1700000000);
  EXPECT_EQ(client.connected_at().nanos(), 250000000);
  EXPECT_FALSE(client.has_disconnected_at());

  EXPECT_EQ(client.subscriptions_current(), 2);
  EXPECT_EQ(client.subscriptions_total(), 5);
  EXPECT_EQ(client.packets_received_bytes(), 1000);
  EXPECT_EQ(client.packets_received_nums(), 10);
  EXPECT_EQ(client.packets_send_bytes(), 2000);
  EXPECT_EQ(client.packets_send_nums(), 20);
  EXPECT_EQ(client.message_dropped(), 3);
  EXPECT_EQ(client.inflight_len(), 4);
  EXPECT_EQ(client.queue_len(), 6);
}

TEST_F(AdminServerTest, GetDisconnectedClient) {
  clients_->AddClient(MakeConnection("A"));
  clients_->SetDisconnected("A");

  GetClientRequest request;
  request.set_client_id("A");
  GetClientResponse response;
  grpc::Status status = client_service_->Get(nullptr, &request, &response);

  ASSERT_TRUE(status.ok());
  ASSERT_TRUE(response.client().has_disconnected_at());
  EXPECT_EQ(response.client().disconnected_at().seconds(), 1700000100);
}

TEST_F(AdminServerTest, GetClientEmptyId) {
  GetClientRequest request;
  GetClientResponse response;
  grpc::Status status = client_service_->Get(nullptr, &request, &response);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(AdminServerTest, GetClientNotFound) {
  GetClientRequest request;
  request.set_client_id("unknown");
  GetClientResponse response;
  grpc::Status status = client_service_->Get(nullptr, &request, &response);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_FALSE(response.has_client());
}

// =============================================================================
// ClientService.Delete Tests
// =============================================================================

TEST_F(AdminServerTest, DeleteWithCleanSessionTerminates) {
  DeleteClientRequest request;
  request.set_client_id("A");
  request.set_clean_session(true);
  DeleteClientResponse response;
  grpc::Status status = client_service_->Delete(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  EXPECT_TRUE(response.success());
  EXPECT_EQ(sessions_.terminated, std::vector<std::string>({"A"}));
  EXPECT_TRUE(sessions_.closed.empty());
}

TEST_F(AdminServerTest, DeleteWithoutCleanSessionClosesConnection) {
  DeleteClientRequest request;
  request.set_client_id("A");
  request.set_clean_session(false);
  DeleteClientResponse response;
  grpc::Status status = client_service_->Delete(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(sessions_.closed, std::vector<std::string>({"A"}));
  EXPECT_TRUE(sessions_.terminated.empty());
}

TEST_F(AdminServerTest, DeleteEmptyId) {
  DeleteClientRequest request;
  request.set_clean_session(true);
  DeleteClientResponse response;
  grpc::Status status = client_service_->Delete(nullptr, &request, &response);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_FALSE(response.success());
  EXPECT_FALSE(response.error_message().empty());
  EXPECT_TRUE(sessions_.terminated.empty());
}

// =============================================================================
// SubscriptionService.List Tests
// =============================================================================

TEST_F(AdminServerTest, ListSubscriptions) {
  SubscriptionOptions options;
  options.topic_filter = "sensors/+";
  options.id = 9;
  options.qos = 1;
  options.no_local = true;
  options.retain_as_published = false;
  options.retain_handling = 2;
  subscriptions_.AddSubscription("c1", options);
  options.topic_filter = "alerts/#";
  subscriptions_.AddSubscription("c1", options);
  subscriptions_.AddSubscription("c2", options);

  ListSubscriptionRequest request;
  request.set_page(1);
  request.set_page_size(2);
  ListSubscriptionResponse response;
  grpc::Status status =
      subscription_service_->List(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(response.total_count(), 3);
  ASSERT_EQ(response.subscriptions_size(), 2);

  const Subscription& first = response.subscriptions(0);
  EXPECT_EQ(first.topic_name(), "sensors/+");
  EXPECT_EQ(first.id(), 9);
  EXPECT_EQ(first.qos(), 1);
  EXPECT_TRUE(first.no_local());
  EXPECT_FALSE(first.retain_as_published());
  EXPECT_EQ(first.retain_handling(), 2);
  EXPECT_EQ(first.client_id(), "c1");

  request.set_page(2);
  response.Clear();
  subscription_service_->List(nullptr, &request, &response);
  ASSERT_EQ(response.subscriptions_size(), 1);
  EXPECT_EQ(response.subscriptions(0).client_id(), "c2");
}

TEST_F(AdminServerTest, ListSubscriptionsEmpty) {
  ListSubscriptionRequest request;
  ListSubscriptionResponse response;
  grpc::Status status =
      subscription_service_->List(nullptr, &request, &response);

  EXPECT_TRUE(status.ok());
  EXPECT_EQ(response.subscriptions_size(), 0);
  EXPECT_EQ(response.total_count(), 0);
}

}  // namespace
}  // namespace broker_admin
