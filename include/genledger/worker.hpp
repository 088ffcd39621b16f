#pragma once

// genledger/worker.hpp — Process identity and health snapshot.
//
// One genledger process runs one Scheduler. Multi-node scheduling is out of
// scope; node_id exists so event logs from several hosts stay attributable.
//
// Invariant: the identity is fixed after the first init_worker_identity().

#include <cstdint>
#include <string>

namespace genledger {

class Scheduler;

struct WorkerIdentity {
  std::string worker_id;   // "w-<pid>" unless GENLEDGER_WORKER_ID is set
  std::string node_id;     // hostname unless GENLEDGER_NODE_ID is set
  std::string semver;
  uint32_t    journal_format_version{0};
  uint32_t    protocol_framing_version{0};
};

struct WorkerHealth {
  std::string worker_id;
  bool        alive{true};
  uint64_t    completed_total{0};
  uint64_t    failed_total{0};
  uint32_t    inflight{0};
  uint64_t    queue_depth{0};
  uint32_t    capacity{0};
  double      utilization_pct{0.0};  // inflight / capacity × 100
};

// Sources, in priority order: explicit arguments, GENLEDGER_WORKER_ID /
// GENLEDGER_NODE_ID, then "w-<pid>" / hostname.
WorkerIdentity init_worker_identity(const std::string& worker_id = "",
                                    const std::string& node_id = "");

const WorkerIdentity& global_worker_identity();

// Counters from global_stats(); in-flight figures from `scheduler` if given.
WorkerHealth worker_health_snapshot(const Scheduler* scheduler, uint32_t capacity);

std::string worker_identity_to_json(const WorkerIdentity& w);
std::string worker_health_to_json(const WorkerHealth& h);

}  // namespace genledger
