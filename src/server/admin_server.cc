// Broker Admin gRPC Server - Implementation
//
// See admin_server.h for the Story and design description.

#include "admin_server.h"

#include <chrono>
#include <cstdint>

namespace broker_admin {

namespace {

void FillTimestamp(std::chrono::system_clock::time_point time,
                   google::protobuf::Timestamp* timestamp) {
  auto since_epoch = time.time_since_epoch();
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
  timestamp->set_seconds(seconds.count());
  timestamp->set_nanos(static_cast<int32_t>(nanos.count()));
}

}  // namespace

void FillClientMessage(const ClientRecord& record, Client* message) {
  message->set_client_id(record.client_id);
  message->set_username(record.username);
  message->set_keep_alive(record.keep_alive);
  message->set_version(record.protocol_version);
  message->set_remote_addr(record.remote_addr);
  message->set_local_addr(record.local_addr);
  FillTimestamp(record.connected_at, message->mutable_connected_at());
  if (record.disconnected_at.has_value()) {
    FillTimestamp(*record.disconnected_at, message->mutable_disconnected_at());
  }
  message->set_session_expiry(record.session_expiry);
  message->set_max_inflight(record.max_inflight);
  message->set_max_queue(record.max_queued);
  message->set_receive_maximum(record.receive_maximum);

  const ClientStats& stats = record.stats;
  message->set_inflight_len(stats.inflight_current);
  message->set_queue_len(stats.queued_current);
  message->set_subscriptions_current(stats.subscriptions_current);
  message->set_subscriptions_total(stats.subscriptions_total);
  message->set_packets_received_bytes(stats.bytes_received);
  message->set_packets_received_nums(stats.packets_received);
  message->set_packets_send_bytes(stats.bytes_sent);
  message->set_packets_send_nums(stats.packets_sent);
  message->set_message_dropped(stats.messages_dropped);
}

void FillSubscriptionMessage(const SubscriptionRecord& record,
                             Subscription* message) {
  message->set_topic_name(record.topic_filter);
  message->set_id(record.id);
  message->set_qos(record.qos);
  message->set_no_local(record.no_local);
  message->set_retain_as_published(record.retain_as_published);
  message->set_retain_handling(record.retain_handling);
  message->set_client_id(record.client_id);
}

// =============================================================================
// ClientService
// =============================================================================

ClientServiceImpl::ClientServiceImpl(const ClientRegistry* client_registry,
                                     SessionController* session_controller,
                                     const PageDefaults& page_defaults)
    : client_registry_(client_registry),
      session_controller_(session_controller),
      page_defaults_(page_defaults) {}

grpc::Status ClientServiceImpl::List(grpc::ServerContext* /*context*/,
                                     const ListClientRequest* request,
                                     ListClientResponse* response) {
  PageRequest page =
      NormalizePage(request->page(), request->page_size(), page_defaults_);

  ClientPage result = client_registry_->ListClients(page.page, page.page_size);
  for (const auto& record : result.records) {
    FillClientMessage(record, response->add_clients());
  }
  response->set_total_count(result.total_count);

  return grpc::Status::OK;
}

grpc::Status ClientServiceImpl::Get(grpc::ServerContext* /*context*/,
                                    const GetClientRequest* request,
                                    GetClientResponse* response) {
  const std::string& client_id = request->client_id();

  // Validate input
  if (client_id.empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "client_id cannot be empty");
  }

  auto record = client_registry_->GetClient(client_id);
  if (!record.has_value()) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "client not found");
  }

  FillClientMessage(*record, response->mutable_client());
  return grpc::Status::OK;
}

grpc::Status ClientServiceImpl::Delete(grpc::ServerContext* /*context*/,
                                       const DeleteClientRequest* request,
                                       DeleteClientResponse* response) {
  const std::string& client_id = request->client_id();

  // Validate input
  if (client_id.empty()) {
    response->set_success(false);
    response->set_error_message("client_id cannot be empty");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "client_id cannot be empty");
  }

  if (request->clean_session()) {
    session_controller_->TerminateSession(client_id);
  } else {
    // Not connected is fine - the kick is idempotent
    session_controller_->CloseConnection(client_id);
  }

  response->set_success(true);
  return grpc::Status::OK;
}

// =============================================================================
// SubscriptionService
// =============================================================================

SubscriptionServiceImpl::SubscriptionServiceImpl(
    const SubscriptionRegistry* subscription_registry,
    const PageDefaults& page_defaults)
    : subscription_registry_(subscription_registry),
      page_defaults_(page_defaults) {}

grpc::Status SubscriptionServiceImpl::List(
    grpc::ServerContext* /*context*/, const ListSubscriptionRequest* request,
    ListSubscriptionResponse* response) {
  PageRequest page =
      NormalizePage(request->page(), request->page_size(), page_defaults_);

  SubscriptionPage result =
      subscription_registry_->ListSubscriptions(page.page, page.page_size);
  for (const auto& record : result.records) {
    FillSubscriptionMessage(record, response->add_subscriptions());
  }
  response->set_total_count(result.total_count);

  return grpc::Status::OK;
}

}  // namespace broker_admin
