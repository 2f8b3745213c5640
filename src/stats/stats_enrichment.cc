// Stats Enrichment - Implementation

#include "stats_enrichment.h"

namespace broker_admin {

bool EnrichClientStats(const StatsSource* source, ClientRecord* record) {
  if (source == nullptr || record == nullptr) {
    return false;
  }

  auto stats = source->GetClientStats(record->client_id);
  if (!stats.has_value()) {
    return false;  // Not initialized yet - keep prior values
  }

  record->stats = *stats;
  return true;
}

}  // namespace broker_admin
