// Persistence Contract
//
// Story:
// The broker keeps queued messages and subscription state in durable backends
// chosen by configuration. This module only defines the contract the broker
// programs against; backends register a PersistenceFactory under a name and
// the broker builds the configured one at startup. The admin registries do
// not use persistence: they are volatile and rebuilt from live broker state.
//
// Error Handling:
// - Operations that can fail return grpc::Status
// - Unknown backend name -> NOT_FOUND
// - Empty backend name -> INVALID_ARGUMENT
// - Factory failures are passed through unchanged
//
// Thread Safety:
// PersistenceFactoryRegistry is thread-safe (protected by mutex). Backend
// implementations define their own guarantees.

#pragma once

#include <grpcpp/support/status.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client_record.h"
#include "registry_event_handler.h"
#include "subscription_registry.h"

namespace broker_admin {

/// Backend selection and backend-specific settings.
struct PersistenceConfig {
  std::string type = "memory";
  std::map<std::string, std::string> options;
};

/// A message waiting in a client's queue.
struct QueuedMessage {
  std::string topic;
  std::string payload;
  uint32_t qos = 0;
  bool retained = false;
};

/// Durable per-client message queue.
class QueueStore {
 public:
  virtual ~QueueStore() = default;

  /// Prepares the queue; clean_start drops anything left from a previous
  /// session.
  virtual grpc::Status Init(bool clean_start) = 0;

  virtual grpc::Status Add(const QueuedMessage& message) = 0;

  /// Removes and returns up to max messages in queue order.
  virtual grpc::Status Read(size_t max, std::vector<QueuedMessage>* messages) = 0;

  virtual size_t Len() const = 0;

  /// Drops every queued message.
  virtual grpc::Status Clean() = 0;

  virtual grpc::Status Close() = 0;
};

/// Durable store of every session's subscriptions.
class SubscriptionStore {
 public:
  virtual ~SubscriptionStore() = default;

  virtual grpc::Status Subscribe(const std::string& client_id,
                                 const SubscriptionOptions& subscription) = 0;

  virtual grpc::Status Unsubscribe(const std::string& client_id,
                                   const std::string& topic_filter) = 0;

  virtual grpc::Status UnsubscribeAll(const std::string& client_id) = 0;

  virtual grpc::Status Close() = 0;
};

/// A configured persistence backend.
class Persistence {
 public:
  virtual ~Persistence() = default;

  virtual grpc::Status Open() = 0;

  virtual grpc::Status Close() = 0;

  /// Creates the message queue for a client.
  /// @param store Receives the queue on success.
  virtual grpc::Status NewQueueStore(const PersistenceConfig& config,
                                     const ConnectionInfo& client,
                                     std::unique_ptr<QueueStore>* store) = 0;

  /// Creates the subscription store. Never fails.
  virtual std::unique_ptr<SubscriptionStore> NewSubscriptionStore(
      const PersistenceConfig& config) = 0;
};

/// Builds a Persistence backend from configuration.
class PersistenceFactory {
 public:
  virtual ~PersistenceFactory() = default;

  /// @param hooks Broker hooks the backend may report to (not owned, may be
  ///              nullptr).
  /// @param persistence Receives the backend on success.
  virtual grpc::Status New(const PersistenceConfig& config,
                           BrokerEventListener* hooks,
                           std::unique_ptr<Persistence>* persistence) = 0;
};

/// Maps backend names to factories.
///
/// Example:
///   PersistenceFactoryRegistry factories;
///   factories.Register("redis", std::make_unique<RedisFactory>());
///   std::unique_ptr<Persistence> persistence;
///   grpc::Status status = factories.Create(config, &handler, &persistence);
class PersistenceFactoryRegistry {
 public:
  PersistenceFactoryRegistry() = default;

  // Non-copyable, non-movable
  PersistenceFactoryRegistry(const PersistenceFactoryRegistry&) = delete;
  PersistenceFactoryRegistry& operator=(const PersistenceFactoryRegistry&) =
      delete;

  /// Registers a factory under name.
  /// @return false if name is empty, factory is null or name is taken.
  bool Register(const std::string& name,
                std::unique_ptr<PersistenceFactory> factory);

  /// Returns true if a factory is registered under name.
  bool Has(const std::string& name) const;

  /// Builds the backend named by config.type.
  /// @return INVALID_ARGUMENT if config.type is empty, NOT_FOUND if no
  ///         factory is registered, otherwise the factory's status.
  grpc::Status Create(const PersistenceConfig& config,
                      BrokerEventListener* hooks,
                      std::unique_ptr<Persistence>* persistence) const;

 private:
  std::map<std::string, std::unique_ptr<PersistenceFactory>> factories_;
  mutable std::mutex mutex_;
};

}  // namespace broker_admin
