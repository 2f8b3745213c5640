// Subscription Registry - Implementation
//
// See subscription_registry.h for the Story and algorithm description.

#include "subscription_registry.h"

#include <utility>

#include "pagination.h"

namespace broker_admin {

void SubscriptionRegistry::AddSubscription(const std::string& client_id,
                                           const SubscriptionOptions& options) {
  SubscriptionRecord record;
  record.topic_filter = options.topic_filter;
  record.id = options.id;
  record.qos = options.qos;
  record.no_local = options.no_local;
  record.retain_as_published = options.retain_as_published;
  record.retain_handling = options.retain_handling;
  record.client_id = client_id;

  SubscriptionKey key{client_id, options.topic_filter};

  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.Set(key, std::move(record));
}

bool SubscriptionRegistry::RemoveSubscription(const std::string& client_id,
                                              const std::string& topic_filter) {
  SubscriptionKey key{client_id, topic_filter};

  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.Remove(key);
}

size_t SubscriptionRegistry::RemoveClientSubscriptions(
    const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.RemoveIf(
      [&client_id](const SubscriptionKey& key, const SubscriptionRecord&) {
        return key.client_id == client_id;
      });
}

SubscriptionPage SubscriptionRegistry::ListSubscriptions(
    uint32_t page, uint32_t page_size) const {
  Window window = ComputeWindow(page, page_size);
  SubscriptionPage result;

  std::lock_guard<std::mutex> lock(mutex_);

  subscriptions_.Iterate(window.start, window.size,
                         [&result](const SubscriptionRecord& record) {
                           result.records.push_back(record);
                         });
  result.total_count = static_cast<uint32_t>(subscriptions_.Size());
  return result;
}

size_t SubscriptionRegistry::GetSubscriptionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.Size();
}

}  // namespace broker_admin
