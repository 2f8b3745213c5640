// Registry Event Handler
//
// Story:
// The broker reports session and subscription lifecycle through hooks. This
// module translates those hooks into registry mutations so the admin view
// follows the broker's live state.
//
// Algorithm:
// - Session created/resumed   -> ClientRegistry::AddClient
// - Transport closed          -> ClientRegistry::SetDisconnected
// - Session terminated        -> ClientRegistry::RemoveClient, then
//                                SubscriptionRegistry::RemoveClientSubscriptions
// - Subscribed / unsubscribed -> SubscriptionRegistry add / remove
//
// Thread Safety:
// Stateless; delegates to thread-safe registries. The two registries are
// locked one after the other, never at the same time.

#pragma once

#include <string>

#include "client_record.h"
#include "client_registry.h"
#include "subscription_registry.h"

namespace broker_admin {

/// Listener interface for broker lifecycle hooks.
///
/// The broker calls these from its connection threads.
class BrokerEventListener {
 public:
  virtual ~BrokerEventListener() = default;

  /// Called when a new session is created for a connection.
  virtual void OnSessionCreated(const ConnectionInfo& connection) = 0;

  /// Called when a connection resumes an existing persistent session.
  virtual void OnSessionResumed(const ConnectionInfo& connection) = 0;

  /// Called when a client's transport connection is closed.
  /// The session may still be alive.
  virtual void OnClosed(const std::string& client_id) = 0;

  /// Called when a session is destroyed (clean end, expiry or takedown).
  virtual void OnSessionTerminated(const std::string& client_id) = 0;

  /// Called after a subscription was accepted.
  virtual void OnSubscribed(const std::string& client_id,
                            const SubscriptionOptions& subscription) = 0;

  /// Called after a topic filter was unsubscribed.
  virtual void OnUnsubscribed(const std::string& client_id,
                              const std::string& topic_filter) = 0;
};

/// Keeps ClientRegistry and SubscriptionRegistry in sync with broker hooks.
///
/// Example:
///   ClientRegistry clients(&stats);
///   SubscriptionRegistry subscriptions;
///   RegistryEventHandler handler(&clients, &subscriptions);
///   broker.AddListener(&handler);
class RegistryEventHandler : public BrokerEventListener {
 public:
  /// @param client_registry Registry for client records (not owned).
  /// @param subscription_registry Registry for subscriptions (not owned).
  /// Both must outlive this object.
  RegistryEventHandler(ClientRegistry* client_registry,
                       SubscriptionRegistry* subscription_registry);

  ~RegistryEventHandler() override = default;

  // Non-copyable, non-movable
  RegistryEventHandler(const RegistryEventHandler&) = delete;
  RegistryEventHandler& operator=(const RegistryEventHandler&) = delete;

  void OnSessionCreated(const ConnectionInfo& connection) override;
  void OnSessionResumed(const ConnectionInfo& connection) override;
  void OnClosed(const std::string& client_id) override;
  void OnSessionTerminated(const std::string& client_id) override;
  void OnSubscribed(const std::string& client_id,
                    const SubscriptionOptions& subscription) override;
  void OnUnsubscribed(const std::string& client_id,
                      const std::string& topic_filter) override;

 private:
  ClientRegistry* client_registry_;
  SubscriptionRegistry* subscription_registry_;
};

}  // namespace broker_admin
