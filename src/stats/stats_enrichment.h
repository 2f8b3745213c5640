// Stats Enrichment
//
// Joins a ClientRecord with the broker's live counters. Runs on every read and
// is never cached, so counters are current as of the read.

#pragma once

#include "client_record.h"
#include "stats_source.h"

namespace broker_admin {

/// Overwrites record->stats with the source's counters for record->client_id.
///
/// If the source has no data for the client (or source is nullptr), the stats
/// block is left unchanged.
/// @return true if the stats block was refreshed.
bool EnrichClientStats(const StatsSource* source, ClientRecord* record);

}  // namespace broker_admin
