// Client Registry
//
// Story:
// This module tracks the clients whose sessions are alive in the broker, both
// connected and disconnected-with-persistent-session. Broker hooks drive the
// lifecycle: a record is added when a session is created or resumed, stamped
// with disconnected_at when the transport closes, and removed when the session
// is terminated. Admin queries list the records page by page, each enriched
// with live statistics at read time.
//
// Algorithm:
// - Records are kept in an IndexedOrderedRegistry keyed by client id
// - Re-adding a known client id (session takeover) replaces the record in
//   place, so its list position is preserved
// - Reads copy records out and join them with the StatsSource; stored records
//   never hold live counters
//
// Thread Safety:
// All public methods are thread-safe. Every call holds mutex_ for its whole
// duration, so a listing is an atomic snapshot with respect to mutations.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "client_record.h"
#include "clock.h"
#include "indexed_ordered_registry.h"
#include "stats_source.h"

namespace broker_admin {

/// One page of the client listing.
struct ClientPage {
  std::vector<ClientRecord> records;
  uint32_t total_count = 0;  // Surviving entries, not just this page
};

/// Ordered, paginated registry of client records.
///
/// Example:
///   InMemoryStatsSource stats;
///   ClientRegistry registry(&stats);
///   registry.AddClient(connection);
///   ClientPage page = registry.ListClients(1, 20);
class ClientRegistry {
 public:
  /// Constructs a client registry.
  ///
  /// @param stats_source Live statistics for enrichment (not owned, may be
  ///                     nullptr). Must outlive this registry.
  /// @param clock Clock implementation for timestamps. If nullptr, uses
  ///              RealClock.
  explicit ClientRegistry(const StatsSource* stats_source = nullptr,
                          std::shared_ptr<Clock> clock = nullptr);

  ~ClientRegistry() = default;

  // Non-copyable, non-movable
  ClientRegistry(const ClientRegistry&) = delete;
  ClientRegistry& operator=(const ClientRegistry&) = delete;

  /// Adds a connected client record.
  ///
  /// A record with the same client id is replaced in place.
  void AddClient(const ConnectionInfo& connection);

  /// Marks a client as disconnected with the current time.
  ///
  /// Calling it again refreshes the timestamp. Unknown client ids are ignored.
  void SetDisconnected(const std::string& client_id);

  /// Removes a client record. Unknown client ids are ignored.
  /// @return true if a record was removed.
  bool RemoveClient(const std::string& client_id);

  /// Returns the enriched record for client_id, or std::nullopt.
  std::optional<ClientRecord> GetClient(const std::string& client_id) const;

  /// Returns one page of enriched records in insertion order.
  ///
  /// @param page 1-based page number. Must be >= 1.
  /// @param page_size Records per page. 0 yields an empty page.
  ClientPage ListClients(uint32_t page, uint32_t page_size) const;

  /// Returns the number of records.
  size_t GetClientCount() const;

 private:
  const StatsSource* stats_source_;
  std::shared_ptr<Clock> clock_;

  IndexedOrderedRegistry<std::string, ClientRecord> clients_;

  // Thread safety
  mutable std::mutex mutex_;
};

}  // namespace broker_admin
