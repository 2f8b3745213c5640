// Client Records
//
// Story:
// A ConnectionInfo is what the broker knows about a connection when a session
// is created or resumed. The ClientRegistry projects it into a ClientRecord,
// which is what administrators see: identity, endpoints, session parameters,
// connection timestamps and a stats block filled at read time.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "stats_source.h"

namespace broker_admin {

/// Connection and session parameters supplied by the broker.
struct ConnectionInfo {
  std::string client_id;
  std::string username;
  int32_t protocol_version = 0;
  std::string local_addr;
  std::string remote_addr;
  int32_t keep_alive = 0;        // Seconds
  uint32_t session_expiry = 0;   // Seconds
  uint32_t max_inflight = 0;
  uint32_t max_queued = 0;
  uint32_t receive_maximum = 0;
  std::chrono::system_clock::time_point connected_at;
};

/// One entry of the client listing.
struct ClientRecord {
  std::string client_id;
  std::string username;
  int32_t protocol_version = 0;
  std::string local_addr;
  std::string remote_addr;
  int32_t keep_alive = 0;
  uint32_t session_expiry = 0;
  uint32_t max_inflight = 0;
  uint32_t max_queued = 0;
  uint32_t receive_maximum = 0;
  std::chrono::system_clock::time_point connected_at;

  // std::nullopt while the client is connected
  std::optional<std::chrono::system_clock::time_point> disconnected_at;

  // Overwritten from the StatsSource on every read
  ClientStats stats;
};

/// Builds a connected ClientRecord (no disconnected_at, zero stats).
ClientRecord MakeClientRecord(const ConnectionInfo& connection);

}  // namespace broker_admin
