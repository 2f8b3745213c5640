// Session Controller - Implementation

#include "session_controller.h"

namespace broker_admin {

EventSessionController::EventSessionController(
    const ClientRegistry* client_registry, BrokerEventListener* listener)
    : client_registry_(client_registry), listener_(listener) {}

void EventSessionController::TerminateSession(const std::string& client_id) {
  listener_->OnSessionTerminated(client_id);
}

bool EventSessionController::CloseConnection(const std::string& client_id) {
  auto client = client_registry_->GetClient(client_id);
  if (!client.has_value() || client->disconnected_at.has_value()) {
    return false;  // Not connected
  }
  listener_->OnClosed(client_id);
  return true;
}

}  // namespace broker_admin
