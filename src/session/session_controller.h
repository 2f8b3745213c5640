// Session Controller
//
// Story:
// Administrators can kick a client. Depending on the request the broker
// either closes only the transport connection (a persistent session stays and
// the client is listed as disconnected) or terminates the whole session,
// which also drops its subscriptions. SessionController is the seam between
// the admin RPC layer and the broker's session layer.
//
// Thread Safety:
// Implementations must be thread-safe.

#pragma once

#include <string>

#include "client_registry.h"
#include "registry_event_handler.h"

namespace broker_admin {

/// Interface onto the broker's session layer.
/// Allows mocking for unit tests.
class SessionController {
 public:
  virtual ~SessionController() = default;

  /// Destroys the session of client_id and everything it owns.
  /// Unknown client ids are ignored.
  virtual void TerminateSession(const std::string& client_id) = 0;

  /// Closes the transport connection of client_id, keeping its session.
  /// @return false if the client has no live connection.
  virtual bool CloseConnection(const std::string& client_id) = 0;
};

/// SessionController for an admin server that is not linked into a broker.
///
/// Applies the outcome of each request as the lifecycle event the broker
/// would have reported, so the registries reflect it immediately.
class EventSessionController : public SessionController {
 public:
  /// @param client_registry Used to check whether a client is connected
  ///                        (not owned).
  /// @param listener Receives the resulting lifecycle events (not owned).
  /// Both must outlive this object.
  EventSessionController(const ClientRegistry* client_registry,
                         BrokerEventListener* listener);

  // Non-copyable, non-movable
  EventSessionController(const EventSessionController&) = delete;
  EventSessionController& operator=(const EventSessionController&) = delete;

  void TerminateSession(const std::string& client_id) override;
  bool CloseConnection(const std::string& client_id) override;

 private:
  const ClientRegistry* client_registry_;
  BrokerEventListener* listener_;
};

}  // namespace broker_admin
