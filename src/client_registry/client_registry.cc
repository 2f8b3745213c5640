// Client Registry - Implementation
//
// See client_registry.h for the Story and algorithm description.

#include "client_registry.h"

#include <utility>

#include "pagination.h"
#include "stats_enrichment.h"

namespace broker_admin {

ClientRecord MakeClientRecord(const ConnectionInfo& connection) {
  ClientRecord record;
  record.client_id = connection.client_id;
  record.username = connection.username;
  record.protocol_version = connection.protocol_version;
  record.local_addr = connection.local_addr;
  record.remote_addr = connection.remote_addr;
  record.keep_alive = connection.keep_alive;
  record.session_expiry = connection.session_expiry;
  record.max_inflight = connection.max_inflight;
  record.max_queued = connection.max_queued;
  record.receive_maximum = connection.receive_maximum;
  record.connected_at = connection.connected_at;
  return record;
}

ClientRegistry::ClientRegistry(const StatsSource* stats_source,
                               std::shared_ptr<Clock> clock)
    : stats_source_(stats_source),
      clock_(clock ? std::move(clock) : std::make_shared<RealClock>()) {}

void ClientRegistry::AddClient(const ConnectionInfo& connection) {
  // Project outside the lock; only the insert needs it
  ClientRecord record = MakeClientRecord(connection);

  std::lock_guard<std::mutex> lock(mutex_);
  clients_.Set(record.client_id, std::move(record));
}

void ClientRegistry::SetDisconnected(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  ClientRecord* record = clients_.Find(client_id);
  if (record == nullptr) {
    return;  // Raced with session termination
  }
  record->disconnected_at = clock_->Now();
}

bool ClientRegistry::RemoveClient(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.Remove(client_id);
}

std::optional<ClientRecord> ClientRegistry::GetClient(
    const std::string& client_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto record = clients_.Get(client_id);
  if (record.has_value()) {
    EnrichClientStats(stats_source_, &*record);
  }
  return record;
}

ClientPage ClientRegistry::ListClients(uint32_t page,
                                       uint32_t page_size) const {
  Window window = ComputeWindow(page, page_size);
  ClientPage result;

  std::lock_guard<std::mutex> lock(mutex_);

  clients_.Iterate(window.start, window.size,
                   [this, &result](const ClientRecord& stored) {
                     result.records.push_back(stored);
                     EnrichClientStats(stats_source_, &result.records.back());
                   });
  result.total_count = static_cast<uint32_t>(clients_.Size());
  return result;
}

size_t ClientRegistry::GetClientCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.Size();
}

}  // namespace broker_admin
