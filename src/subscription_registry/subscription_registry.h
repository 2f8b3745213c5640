// Subscription Registry
//
// Story:
// This module tracks the active topic subscriptions of every session so that
// administrators can page through them. Broker hooks add a record on
// subscribe and remove it on unsubscribe or when the owning session ends.
//
// Algorithm:
// - Records are kept in an IndexedOrderedRegistry keyed by
//   SubscriptionKey{client_id, topic_filter}
// - The key is a structured pair, so ("a_b", "c") and ("a", "b_c") never
//   collide the way a "client_topic" string key would
// - Re-subscribing to the same filter updates the record in place
//
// Thread Safety:
// All public methods are thread-safe (protected by mutex). This registry and
// ClientRegistry have independent locks and are never locked together.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "indexed_ordered_registry.h"

namespace broker_admin {

/// Subscription options as requested by the client.
struct SubscriptionOptions {
  std::string topic_filter;  // Full filter, including any share prefix
  uint32_t id = 0;           // Subscription identifier, 0 if none
  uint32_t qos = 0;
  bool no_local = false;
  bool retain_as_published = false;
  uint32_t retain_handling = 0;
};

/// One entry of the subscription listing.
struct SubscriptionRecord {
  std::string topic_filter;
  uint32_t id = 0;
  uint32_t qos = 0;
  bool no_local = false;
  bool retain_as_published = false;
  uint32_t retain_handling = 0;
  std::string client_id;
};

/// Composite registry key: one entry per (client, filter) pair.
struct SubscriptionKey {
  std::string client_id;
  std::string topic_filter;

  bool operator==(const SubscriptionKey& other) const {
    return client_id == other.client_id && topic_filter == other.topic_filter;
  }
};

struct SubscriptionKeyHash {
  size_t operator()(const SubscriptionKey& key) const {
    size_t seed = std::hash<std::string>()(key.client_id);
    // boost::hash_combine mixing
    seed ^= std::hash<std::string>()(key.topic_filter) + 0x9e3779b9 +
            (seed << 6) + (seed >> 2);
    return seed;
  }
};

/// One page of the subscription listing.
struct SubscriptionPage {
  std::vector<SubscriptionRecord> records;
  uint32_t total_count = 0;
};

/// Ordered, paginated registry of subscription records.
///
/// Example:
///   SubscriptionRegistry registry;
///   registry.AddSubscription("c1", {"sensors/+", 0, 1});
///   SubscriptionPage page = registry.ListSubscriptions(1, 20);
class SubscriptionRegistry {
 public:
  SubscriptionRegistry() = default;
  ~SubscriptionRegistry() = default;

  // Non-copyable, non-movable
  SubscriptionRegistry(const SubscriptionRegistry&) = delete;
  SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

  /// Adds or updates the subscription of client_id to options.topic_filter.
  void AddSubscription(const std::string& client_id,
                       const SubscriptionOptions& options);

  /// Removes one subscription. Unknown pairs are ignored.
  /// @return true if a record was removed.
  bool RemoveSubscription(const std::string& client_id,
                          const std::string& topic_filter);

  /// Removes every subscription owned by client_id.
  ///
  /// Used when a session is terminated. Walks the whole registry.
  /// @return Number of removed records.
  size_t RemoveClientSubscriptions(const std::string& client_id);

  /// Returns one page of records in insertion order.
  ///
  /// @param page 1-based page number. Must be >= 1.
  /// @param page_size Records per page. 0 yields an empty page.
  SubscriptionPage ListSubscriptions(uint32_t page, uint32_t page_size) const;

  /// Returns the number of records.
  size_t GetSubscriptionCount() const;

 private:
  IndexedOrderedRegistry<SubscriptionKey, SubscriptionRecord,
                         SubscriptionKeyHash>
      subscriptions_;

  mutable std::mutex mutex_;
};

}  // namespace broker_admin
