#include "genledger/worker.hpp"

#include "genledger/jsonlite.hpp"
#include "genledger/observability.hpp"
#include "genledger/scheduler.hpp"
#include "genledger/version.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <unistd.h>  // getpid, gethostname

namespace genledger {

namespace {

WorkerIdentity g_worker_identity;
std::mutex     g_init_mu;
bool           g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

std::string env_or(const char* name, const std::string& fallback) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : fallback;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& worker_id, const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  if (g_initialized) return g_worker_identity;

  g_worker_identity.worker_id = worker_id.empty()
      ? env_or("GENLEDGER_WORKER_ID", "w-" + std::to_string(static_cast<long>(::getpid())))
      : worker_id;
  g_worker_identity.node_id = node_id.empty() ? env_or("GENLEDGER_NODE_ID", get_hostname())
                                              : node_id;

  const auto manifest = version::current_manifest();
  g_worker_identity.semver = manifest.semver;
  g_worker_identity.journal_format_version = manifest.journal_format;
  g_worker_identity.protocol_framing_version = manifest.protocol_framing;

  g_initialized = true;
  return g_worker_identity;
}

const WorkerIdentity& global_worker_identity() {
  {
    std::lock_guard<std::mutex> lk(g_init_mu);
    if (g_initialized) return g_worker_identity;
  }
  init_worker_identity();
  return g_worker_identity;
}

WorkerHealth worker_health_snapshot(const Scheduler* scheduler, uint32_t capacity) {
  WorkerHealth h;
  h.worker_id = global_worker_identity().worker_id;
  h.alive = true;

  const auto& stats = global_stats();
  h.completed_total = stats.completed.load(std::memory_order_relaxed);
  h.failed_total = stats.failed.load(std::memory_order_relaxed) +
                   stats.timeouts.load(std::memory_order_relaxed);
  h.capacity = capacity;
  if (scheduler) {
    h.inflight = scheduler->inflight();
    h.queue_depth = scheduler->queue_depth();
    h.alive = scheduler->running();
  }
  if (capacity > 0) h.utilization_pct = 100.0 * h.inflight / capacity;
  return h;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  std::ostringstream o;
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(w.worker_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(w.node_id) << "\""
    << ",\"semver\":\"" << jsonlite::escape(w.semver) << "\""
    << ",\"journal_format_version\":" << w.journal_format_version
    << ",\"protocol_framing_version\":" << w.protocol_framing_version
    << "}";
  return o.str();
}

std::string worker_health_to_json(const WorkerHealth& h) {
  std::ostringstream o;
  char buf[32];
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(h.worker_id) << "\""
    << ",\"alive\":" << (h.alive ? "true" : "false")
    << ",\"completed_total\":" << h.completed_total
    << ",\"failed_total\":" << h.failed_total
    << ",\"inflight\":" << h.inflight
    << ",\"queue_depth\":" << h.queue_depth
    << ",\"capacity\":" << h.capacity
    << ",\"utilization_pct\":";
  std::snprintf(buf, sizeof(buf), "%.2f", h.utilization_pct);
  o << buf << "}";
  return o.str();
}

}  // namespace genledger
