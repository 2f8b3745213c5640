// Live Statistics Source - Implementation

#include "stats_source.h"

namespace broker_admin {

std::optional<ClientStats> InMemoryStatsSource::GetClientStats(
    const std::string& client_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = stats_.find(client_id);
  if (it == stats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryStatsSource::Update(const std::string& client_id,
                                 const ClientStats& stats) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_[client_id] = stats;
}

void InMemoryStatsSource::Remove(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.erase(client_id);
}

}  // namespace broker_admin
