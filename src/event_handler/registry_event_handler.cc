// Registry Event Handler - Implementation
//
// See registry_event_handler.h for the Story and algorithm description.

#include "registry_event_handler.h"

namespace broker_admin {

RegistryEventHandler::RegistryEventHandler(
    ClientRegistry* client_registry,
    SubscriptionRegistry* subscription_registry)
    : client_registry_(client_registry),
      subscription_registry_(subscription_registry) {}

void RegistryEventHandler::OnSessionCreated(const ConnectionInfo& connection) {
  client_registry_->AddClient(connection);
}

void RegistryEventHandler::OnSessionResumed(const ConnectionInfo& connection) {
  // Takeover of a known client id keeps its list position
  client_registry_->AddClient(connection);
}

void RegistryEventHandler::OnClosed(const std::string& client_id) {
  client_registry_->SetDisconnected(client_id);
}

void RegistryEventHandler::OnSessionTerminated(const std::string& client_id) {
  client_registry_->RemoveClient(client_id);
  subscription_registry_->RemoveClientSubscriptions(client_id);
}

void RegistryEventHandler::OnSubscribed(
    const std::string& client_id, const SubscriptionOptions& subscription) {
  subscription_registry_->AddSubscription(client_id, subscription);
}

void RegistryEventHandler::OnUnsubscribed(const std::string& client_id,
                                          const std::string& topic_filter) {
  subscription_registry_->RemoveSubscription(client_id, topic_filter);
}

}  // namespace broker_admin
