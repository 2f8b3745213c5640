// Live Statistics Source
//
// Story:
// The broker keeps per-client counters (packets, bytes, drops, queue depths)
// that change on every packet. Admin listings join these counters onto client
// records at read time through the StatsSource interface.
//
// Thread Safety:
// Implementations must be thread-safe and must never call back into a
// registry, because they are queried while a registry lock is held.

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace broker_admin {

/// Live counters for one client.
struct ClientStats {
  uint32_t subscriptions_current = 0;
  uint32_t subscriptions_total = 0;
  uint64_t bytes_received = 0;
  uint64_t packets_received = 0;
  uint64_t bytes_sent = 0;
  uint64_t packets_sent = 0;
  uint64_t messages_dropped = 0;
  uint32_t inflight_current = 0;
  uint32_t queued_current = 0;
};

/// Read-only view onto the broker's live per-client statistics.
class StatsSource {
 public:
  virtual ~StatsSource() = default;

  /// Returns the current counters for client_id, or std::nullopt if the
  /// broker has no statistics for it (yet).
  virtual std::optional<ClientStats> GetClientStats(
      const std::string& client_id) const = 0;
};

/// StatsSource backed by a mutex-protected map.
///
/// The broker's packet path calls Update(); admin reads call GetClientStats().
class InMemoryStatsSource : public StatsSource {
 public:
  InMemoryStatsSource() = default;

  // Non-copyable, non-movable
  InMemoryStatsSource(const InMemoryStatsSource&) = delete;
  InMemoryStatsSource& operator=(const InMemoryStatsSource&) = delete;

  std::optional<ClientStats> GetClientStats(
      const std::string& client_id) const override;

  /// Replaces the counters for client_id.
  void Update(const std::string& client_id, const ClientStats& stats);

  /// Forgets the counters for client_id. Unknown ids are ignored.
  void Remove(const std::string& client_id);

 private:
  std::unordered_map<std::string, ClientStats> stats_;
  mutable std::mutex mutex_;
};

}  // namespace broker_admin
