// Broker Admin gRPC Server
//
// Story:
// This module implements the admin gRPC service handlers. It exposes the
// client and subscription registries to operators: paginated listings, a
// single-client lookup and a client kick. Handlers are thin - they validate
// input, apply paging defaults, delegate to the registries and convert
// records to protobuf messages.
//
// Error Handling:
// - Uses gRPC error codes (INVALID_ARGUMENT, NOT_FOUND)
// - Empty client_id -> INVALID_ARGUMENT
// - Get of an unknown client -> NOT_FOUND
// - Delete of an unknown client -> OK (idempotent)
//
// Thread Safety:
// Stateless handlers delegate to thread-safe dependencies.

#pragma once

#include <grpcpp/grpcpp.h>

#include "admin_service.grpc.pb.h"
#include "client_registry.h"
#include "pagination.h"
#include "session_controller.h"
#include "subscription_registry.h"

namespace broker_admin {

/// Converts a registry record to its protobuf form.
void FillClientMessage(const ClientRecord& record, Client* message);

/// Converts a registry record to its protobuf form.
void FillSubscriptionMessage(const SubscriptionRecord& record,
                             Subscription* message);

/// gRPC ClientService implementation.
///
/// Example:
///   ClientRegistry registry(&stats);
///   ClientServiceImpl service(&registry, &sessions, PageDefaults{});
///   // Use service with grpc::ServerBuilder
class ClientServiceImpl final : public ClientService::Service {
 public:
  /// Constructs the service implementation.
  ///
  /// @param client_registry Registry to query (not owned).
  /// @param session_controller Session layer for Delete (not owned).
  /// @param page_defaults Defaults for omitted paging fields.
  /// Pointers must outlive this object.
  ClientServiceImpl(const ClientRegistry* client_registry,
                    SessionController* session_controller,
                    const PageDefaults& page_defaults);

  ~ClientServiceImpl() = default;

  // Non-copyable, non-movable
  ClientServiceImpl(const ClientServiceImpl&) = delete;
  ClientServiceImpl& operator=(const ClientServiceImpl&) = delete;

  /// Lists clients with live session state, connected or not.
  /// @return Always OK.
  grpc::Status List(grpc::ServerContext* context,
                    const ListClientRequest* request,
                    ListClientResponse* response) override;

  /// Returns one client.
  /// @return INVALID_ARGUMENT if client_id is empty, NOT_FOUND if unknown.
  grpc::Status Get(grpc::ServerContext* context,
                   const GetClientRequest* request,
                   GetClientResponse* response) override;

  /// Kicks a client: terminates its session if clean_session is set,
  /// otherwise closes only its connection.
  /// @return INVALID_ARGUMENT if client_id is empty.
  grpc::Status Delete(grpc::ServerContext* context,
                      const DeleteClientRequest* request,
                      DeleteClientResponse* response) override;

 private:
  const ClientRegistry* client_registry_;
  SessionController* session_controller_;
  PageDefaults page_defaults_;
};

/// gRPC SubscriptionService implementation.
class SubscriptionServiceImpl final : public SubscriptionService::Service {
 public:
  /// @param subscription_registry Registry to query (not owned).
  /// @param page_defaults Defaults for omitted paging fields.
  SubscriptionServiceImpl(const SubscriptionRegistry* subscription_registry,
                          const PageDefaults& page_defaults);

  ~SubscriptionServiceImpl() = default;

  // Non-copyable, non-movable
  SubscriptionServiceImpl(const SubscriptionServiceImpl&) = delete;
  SubscriptionServiceImpl& operator=(const SubscriptionServiceImpl&) = delete;

  /// Lists active subscriptions.
  /// @return Always OK.
  grpc::Status List(grpc::ServerContext* context,
                    const ListSubscriptionRequest* request,
                    ListSubscriptionResponse* response) override;

 private:
  const SubscriptionRegistry* subscription_registry_;
  PageDefaults page_defaults_;
};

}  // namespace broker_admin
