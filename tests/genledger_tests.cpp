#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "genledger/admission.hpp"
#include "genledger/config.hpp"
#include "genledger/frames.hpp"
#include "genledger/hash.hpp"
#include "genledger/journal.hpp"
#include "genledger/jsonlite.hpp"
#include "genledger/ledger.hpp"
#include "genledger/observability.hpp"
#include "genledger/pricing.hpp"
#include "genledger/process_client.hpp"
#include "genledger/rate_limiter.hpp"
#include "genledger/reconciler.hpp"
#include "genledger/remote_client.hpp"
#include "genledger/scheduler.hpp"
#include "genledger/service.hpp"
#include "genledger/store.hpp"
#include "genledger/types.hpp"
#include "genledger/version.hpp"
#include "genledger/worker.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool wait_until(const std::function<bool()>& pred, int timeout_ms = 5000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

fs::path temp_path(const std::string& name) {
  const fs::path p = fs::temp_directory_path() /
                     ("genledger_test_" + std::to_string(::getpid()) + "_" + name);
  std::error_code ec;
  fs::remove(p, ec);
  return p;
}

// ---------------------------------------------------------------------------
// Test doubles
// ---------------------------------------------------------------------------

struct ManualClock {
  std::shared_ptr<std::atomic<uint64_t>> now = std::make_shared<std::atomic<uint64_t>>(1700000000000ULL);
  genledger::UnixMsClock fn() const {
    auto n = now;
    return [n] { return n->load(); };
  }
  void advance(uint64_t ms) { now->fetch_add(ms); }
};

enum class Behavior { complete, fail, hang, throw_on_create, fail_create, complete_without_url };

// Scripted provider. Jobs take behaviors in creation order; once the script
// is exhausted every job completes. create() can be gated shut, globally or
// for a single idempotency key.
class FakeClient : public genledger::IRemoteJobClient {
 public:
  void script(std::vector<Behavior> b) {
    std::lock_guard<std::mutex> lk(mu_);
    script_ = std::move(b);
  }
  void close_gate() {
    std::lock_guard<std::mutex> lk(mu_);
    gate_open_ = false;
  }
  void open_gate() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      gate_open_ = true;
    }
    cv_.notify_all();
  }
  void hold(const std::string& idempotency_key) {
    std::lock_guard<std::mutex> lk(mu_);
    held_.insert(idempotency_key);
  }
  void release(const std::string& idempotency_key) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      held_.erase(idempotency_key);
    }
    cv_.notify_all();
  }
  int creates() const { return creates_.load(); }
  int polls() const { return polls_.load(); }
  int waiting_at_gate() const { return waiting_.load(); }

  genledger::CreateJobResult create(const genledger::CreateJobRequest& req) override {
    Behavior b = Behavior::complete;
    int n = 0;
    {
      std::unique_lock<std::mutex> lk(mu_);
      ++waiting_;
      cv_.wait(lk, [&] { return gate_open_ && held_.count(req.idempotency_key) == 0; });
      --waiting_;
      n = creates_.fetch_add(1);
      if (static_cast<size_t>(n) < script_.size()) b = script_[n];
      last_request_ = req;
    }
    if (b == Behavior::throw_on_create) throw std::runtime_error("connection reset by peer");
    genledger::CreateJobResult r;
    if (b == Behavior::fail_create) {
      r.error = "provider rejected request";
      return r;
    }
    r.ok = true;
    r.job_handle = "job-" + std::to_string(n);
    std::lock_guard<std::mutex> lk(mu_);
    jobs_[r.job_handle] = b;
    return r;
  }

  genledger::PollResult poll(const std::string& handle) override {
    polls_.fetch_add(1);
    Behavior b = Behavior::complete;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = jobs_.find(handle);
      if (it != jobs_.end()) b = it->second;
    }
    genledger::PollResult r;
    r.ok = true;
    switch (b) {
      case Behavior::complete:
        r.status = genledger::RemoteStatus::completed;
        r.raw_status = "success";
        r.result_locator = "https://cdn.example/" + handle + ".mp4";
        r.progress = 100;
        break;
      case Behavior::fail:
        r.status = genledger::RemoteStatus::failed;
        r.raw_status = "failed";
        r.error = "content policy violation";
        break;
      case Behavior::complete_without_url:
        r.status = genledger::RemoteStatus::completed;
        r.raw_status = "completed";
        break;
      default:
        r.status = genledger::RemoteStatus::in_progress;
        r.raw_status = "processing";
        r.progress = 40;
        break;
    }
    return r;
  }

  std::string client_id() const override { return "fake"; }

  genledger::CreateJobRequest last_request() {
    std::lock_guard<std::mutex> lk(mu_);
    return last_request_;
  }

 private:
  mutable std::mutex                 mu_;
  std::condition_variable            cv_;
  bool                               gate_open_{true};
  std::set<std::string>              held_;
  std::vector<Behavior>              script_;
  std::map<std::string, Behavior>    jobs_;
  std::atomic<int>                   creates_{0};
  std::atomic<int>                   polls_{0};
  std::atomic<int>                   waiting_{0};
  genledger::CreateJobRequest        last_request_;
};

genledger::Config test_config() {
  genledger::Config c;
  c.tick_interval_ms = 1;
  c.poll_interval_ms = 1;
  c.max_poll_ms = 2000;
  c.sweep_interval_ms = 10;
  c.stale_running_ms = 60000;
  return c;
}

// Everything a service needs, wired against in-memory state.
struct Harness {
  explicit Harness(genledger::Config c = test_config())
      : config(c), svc(store, client, prices, config, clock.fn()) {}

  void fund(const std::string& owner, int64_t amount) {
    auto r = svc.admin_adjust(owner, amount, "seed");
    expect(r.ok, "seed adjustment must succeed");
  }

  genledger::SubmitResult submit(const std::string& owner, uint32_t count,
                                 const std::string& key = "") {
    genledger::SubmitRequest req;
    req.params.prompt = "a red fox running through snow";
    req.params.model = "sora-2";
    req.params.orientation = "portrait";
    req.params.size = "small";
    req.params.duration_s = 10;
    req.count = count;
    req.idempotency_key = key;
    return svc.submit_batch(owner, req);
  }

  // Claims whatever the queue head allows, then waits for every unit to exit.
  void drain() {
    auto& s = svc.scheduler();
    for (int i = 0; i < 10000; ++i) {
      const auto r = s.tick();
      if (r == genledger::TickResult::idle && s.inflight() == 0) break;
      if (r == genledger::TickResult::deferred || r == genledger::TickResult::idle) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
    expect(s.wait_idle(std::chrono::milliseconds(5000)), "scheduler must drain");
    s.reap();
  }

  std::vector<genledger::Task> tasks(const std::string& batch_id) {
    return store.tasks_for_batch(batch_id);
  }

  ManualClock                  clock;
  genledger::MemoryLedgerStore store;
  FakeClient                   client;
  genledger::PriceTable        prices;
  genledger::Config            config;
  genledger::LedgerService     svc;
};

std::mutex g_events_mu;
std::vector<genledger::LedgerEvent> g_events;

void capture_event(const genledger::LedgerEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

size_t count_events(genledger::EventKind kind) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  size_t n = 0;
  for (const auto& ev : g_events) {
    if (ev.kind == kind) ++n;
  }
  return n;
}

size_t positive_tx_for(genledger::ILedgerStore& store, const std::string& task_id) {
  size_t n = 0;
  for (const auto& tx : store.all_transactions()) {
    if (tx.delta > 0 && tx.ref_task_id == task_id) ++n;
  }
  return n;
}

// ============================================================================
// Phase 1: Hashing and identifiers
// ============================================================================

void test_blake3_known_vectors() {
  expect(genledger::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(genledger::blake3_hex("hello") ==
             "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  expect(genledger::journal_link_digest(payload) != genledger::request_fingerprint(payload),
         "jrn: and req: domains must differ");
  expect(genledger::request_fingerprint(payload) == genledger::request_fingerprint(payload),
         "fingerprint must be deterministic");
}

void test_record_ids_unique() {
  std::vector<std::string> ids;
  for (int i = 0; i < 500; ++i) ids.push_back(genledger::make_record_id("tsk"));
  std::sort(ids.begin(), ids.end());
  expect(std::adjacent_find(ids.begin(), ids.end()) == ids.end(), "record ids must be unique");
  expect(ids.front().rfind("tsk_", 0) == 0, "record id carries its prefix");
}

// ============================================================================
// Phase 2: Task state machine and records
// ============================================================================

void test_transition_graph() {
  using genledger::TaskStatus;
  using genledger::is_valid_transition;
  expect(is_valid_transition(TaskStatus::pending, TaskStatus::queued), "pending→queued");
  expect(is_valid_transition(TaskStatus::queued, TaskStatus::running), "queued→running");
  expect(is_valid_transition(TaskStatus::pending, TaskStatus::running), "pending→running (claim)");
  expect(is_valid_transition(TaskStatus::running, TaskStatus::completed), "running→completed");
  expect(is_valid_transition(TaskStatus::running, TaskStatus::failed), "running→failed");
  expect(is_valid_transition(TaskStatus::failed, TaskStatus::queued), "failed→queued (retry)");
  expect(is_valid_transition(TaskStatus::running, TaskStatus::cancelled), "running→cancelled");
  expect(!is_valid_transition(TaskStatus::completed, TaskStatus::queued), "completed is terminal");
  expect(!is_valid_transition(TaskStatus::cancelled, TaskStatus::queued), "cancelled is terminal");
  expect(!is_valid_transition(TaskStatus::failed, TaskStatus::completed), "failed→completed refused");
  expect(!is_valid_transition(TaskStatus::queued, TaskStatus::completed), "queued→completed refused");
}

void test_task_json_roundtrip() {
  genledger::Task t;
  t.id = "tsk_1";
  t.batch_id = "bat_1";
  t.owner = "alice";
  t.params.prompt = "line\nbreak \"quoted\"";
  t.params.model = "sora-2";
  t.status = genledger::TaskStatus::failed;
  t.error_summary = "boom";
  t.retries = 2;
  t.created_at_ms = 42;
  std::optional<genledger::jsonlite::JsonError> err;
  const auto obj = genledger::jsonlite::parse(genledger::task_to_json(t), &err);
  expect(!err, "task json must parse");
  const auto back = genledger::task_from_json(obj);
  expect(back.has_value(), "task must decode");
  expect(back->params.prompt == t.params.prompt, "prompt survives escaping");
  expect(back->status == genledger::TaskStatus::failed, "status survives");
  expect(back->retries == 2 && back->created_at_ms == 42, "numbers survive");
}

// ============================================================================
// Phase 3: JSON codec
// ============================================================================

void test_jsonlite_strict() {
  using genledger::jsonlite::validate_strict;
  expect(!validate_strict("{\"a\":1}"), "valid object accepted");
  expect(validate_strict("{\"a\":1,\"a\":2}").has_value(), "duplicate key rejected");
  expect(validate_strict("{\"a\":1} x").has_value(), "trailing data rejected");
  expect(validate_strict("{\"a\":NaN}").has_value(), "NaN rejected");
}

void test_jsonlite_extractors() {
  namespace jl = genledger::jsonlite;
  std::optional<jl::JsonError> err;
  const auto obj = jl::parse(
      "{\"s\":\"x\",\"n\":7,\"neg\":-3,\"arr\":[\"a\",\"b\"],\"o\":{\"k\":true},\"z\":null}", &err);
  expect(!err, "parse ok");
  expect(jl::get_string(obj, "s") == "x", "string");
  expect(jl::get_u64(obj, "n") == 7, "u64");
  expect(jl::get_i64(obj, "neg") == -3, "i64 negative");
  expect(jl::get_i64(obj, "n") == 7, "i64 from non-negative");
  expect(jl::get_string_array(obj, "arr").size() == 2, "string array");
  expect(jl::get_bool(jl::get_object(obj, "o"), "k"), "nested bool");
  expect(!jl::has(obj, "z"), "null counts as absent");
  expect(jl::get_string(obj, "missing", "def") == "def", "default on missing");

  const auto sorted = jl::parse("{\"b\":[1,-2],\"a\":\"x\\ny\"}", &err);
  expect(jl::to_json(sorted) == "{\"a\":\"x\\ny\",\"b\":[1,-2]}", "serialization sorts keys");
}

// ============================================================================
// Phase 4: Configuration
// ============================================================================

void test_config_defaults_valid() {
  genledger::Config c;
  expect(genledger::validate_config(c).empty(), "defaults must validate");
  expect(c.global_concurrency == 10 && c.per_owner_concurrency == 10, "default caps");
  expect(c.rate_window_ms == 60000, "default rate window");
  expect(c.max_tasks_per_batch == 50 && c.max_prompt_chars == 3000, "default bounds");
}

void test_config_json_errors() {
  auto r = genledger::parse_config_json("{\"global_concurrency\":4,\"journal_path\":\"/tmp/j\"}");
  expect(r.ok, "known keys accepted");
  expect(r.config.global_concurrency == 4 && r.config.journal_path == "/tmp/j", "values applied");

  r = genledger::parse_config_json("{\"global_concurency\":4}");
  expect(!r.ok && r.error_code == "config_unknown_key", "typo rejected");

  r = genledger::parse_config_json("{\"per_owner_concurrency\":0}");
  expect(!r.ok && r.error_code == "config_invalid", "zero cap rejected");

  r = genledger::parse_config_json("{\"global_concurrency\":");
  expect(!r.ok && r.error_code == "config_parse_error", "broken json rejected");
}

void test_config_env_override() {
  ::setenv("GENLEDGER_GLOBAL_CONCURRENCY", "3", 1);
  ::setenv("GENLEDGER_JOURNAL_PATH", "/var/tmp/gl.ndjson", 1);
  ::setenv("GENLEDGER_RATE_LIMIT", "not-a-number", 1);
  const auto c = genledger::apply_env_overrides(genledger::Config{});
  ::unsetenv("GENLEDGER_GLOBAL_CONCURRENCY");
  ::unsetenv("GENLEDGER_JOURNAL_PATH");
  ::unsetenv("GENLEDGER_RATE_LIMIT");
  expect(c.global_concurrency == 3, "numeric env override");
  expect(c.journal_path == "/var/tmp/gl.ndjson", "string env override");
  expect(c.rate_limit_per_window == 10, "unparseable env value keeps default");
}

// ============================================================================
// Phase 5: Pricing table
// ============================================================================

void test_pricing_defaults() {
  genledger::PriceTable p;
  expect(p.unit_cost("sora-2", 10, "small") == 15, "sora-2 10s");
  expect(p.unit_cost("sora-2", 5, "large") == 8, "sora-2 5s");
  expect(p.unit_cost("sora-2-pro", 25, "small") == 100, "sora-2-pro 25s");
  expect(p.unit_cost("unknown-model", 10, "small") == 15, "unknown model → default cost");
  expect(p.unit_cost("sora-2", 7, "small") == 15, "unknown duration → default cost");
}

void test_pricing_allow_list() {
  genledger::PriceTable p;
  genledger::GenerationParams g;
  g.model = "sora-2-pro";
  g.duration_s = 10;
  g.size = "small";
  g.orientation = "portrait";
  auto v = p.validate(g);
  expect(!v.ok && v.field == "duration", "10s not allowed for sora-2-pro");
  g.duration_s = 15;
  g.size = "gigantic";
  v = p.validate(g);
  expect(!v.ok && v.field == "size", "size outside allow-list");
  g.size = "large";
  expect(p.validate(g).ok, "allowed combination");
  g.model = "nope";
  v = p.validate(g);
  expect(!v.ok && v.field == "model", "unknown model rejected by validation");
}

void test_pricing_parse() {
  auto r = genledger::parse_price_table(
      "{\"default_cost\":20,\"models\":{\"m1\":{\"durations\":[4,8],\"prices\":{\"4\":3,\"8/large\":9}}}}");
  expect(r.ok, "price table parses");
  expect(r.table.unit_cost("m1", 4, "small") == 3, "duration price");
  expect(r.table.unit_cost("m1", 8, "large") == 9, "duration/size price");
  expect(r.table.unit_cost("m1", 8, "small") == 20, "missing price → default");
  expect(!r.table.has_model("sora-2"), "file replaces built-ins");

  r = genledger::parse_price_table("{\"models\":{\"m1\":{\"durations\":[4],\"prices\":{\"4\":0}}}}");
  expect(!r.ok && r.error_code == "price_table_invalid", "zero price rejected");
}

// ============================================================================
// Phase 6: Remote status mapping and wire parsing
// ============================================================================

void test_status_mapping() {
  using genledger::RemoteStatus;
  using genledger::map_remote_status;
  expect(map_remote_status("SUCCESS") == RemoteStatus::completed, "SUCCESS → completed");
  expect(map_remote_status("completed") == RemoteStatus::completed, "completed");
  expect(map_remote_status("Failed") == RemoteStatus::failed, "Failed → failed");
  expect(map_remote_status("error") == RemoteStatus::failed, "error → failed");
  expect(map_remote_status("In Progress") == RemoteStatus::in_progress, "space form");
  expect(map_remote_status("in_progress") == RemoteStatus::in_progress, "underscore form");
  expect(map_remote_status("queued") == RemoteStatus::queued, "queued");
  expect(map_remote_status("canceled") == RemoteStatus::cancelled, "US spelling");
  expect(map_remote_status("rendering_v2") == RemoteStatus::in_progress,
         "unknown status must never be terminal");
  expect(map_remote_status("") == RemoteStatus::in_progress, "empty → in_progress");
  expect(!genledger::is_terminal(RemoteStatus::in_progress), "in_progress not terminal");
}

void test_poll_response_fallbacks() {
  auto r = genledger::parse_poll_response(
      "{\"data\":{\"status\":\"SUCCESS\",\"video_url\":\"https://a/v.mp4\",\"progress\":\"75%\"}}");
  expect(r.ok && r.status == genledger::RemoteStatus::completed, "data.status used");
  expect(r.result_locator == "https://a/v.mp4", "data.video_url used");
  expect(r.progress && *r.progress == 75, "percent string progress");

  r = genledger::parse_poll_response(
      "{\"status\":\"failed\",\"fail_reason\":\"nsfw\",\"result_url\":\"\"}");
  expect(r.status == genledger::RemoteStatus::failed, "top-level status used");
  expect(r.error == "nsfw", "fail_reason used when error/message absent");

  r = genledger::parse_poll_response("{\"status\":\"completed\",\"result_url\":\"https://b\"}");
  expect(r.result_locator == "https://b", "result_url fallback");

  r = genledger::parse_poll_response("{\"status\":\"processing\",\"started_at\":1700000000}");
  expect(r.remote_started_at_ms == 1700000000000ULL, "second timestamps scaled to ms");

  r = genledger::parse_poll_response("not json");
  expect(!r.ok && !r.error.empty(), "garbage is a failed poll");
}

void test_create_response_and_request() {
  auto c = genledger::parse_create_response("{\"id\":\"abc\"}");
  expect(c.ok && c.job_handle == "abc", "id used");
  c = genledger::parse_create_response("{\"task_id\":\"t-9\"}");
  expect(c.ok && c.job_handle == "t-9", "task_id fallback");
  c = genledger::parse_create_response("{\"message\":\"quota exceeded\"}");
  expect(!c.ok && c.error == "quota exceeded", "missing id is an error with provider text");

  genledger::CreateJobRequest req;
  req.model = "sora-2";
  req.prompt = "p";
  req.media_reference = "https://img/1.png";
  req.duration_s = 10;
  std::optional<genledger::jsonlite::JsonError> err;
  const auto obj = genledger::jsonlite::parse(genledger::create_request_to_json(req), &err);
  expect(!err, "create request is valid JSON");
  expect(genledger::jsonlite::get_string_array(obj, "images").size() == 1, "image carried");
  expect(genledger::jsonlite::get_u64(obj, "duration") == 10, "duration carried");
}

// ============================================================================
// Phase 7: Ledger store
// ============================================================================

genledger::AdmissionRecord make_admission(const std::string& owner, uint32_t count, int64_t unit) {
  genledger::AdmissionRecord rec;
  rec.batch.id = genledger::make_record_id("bat");
  rec.batch.owner = owner;
  rec.batch.params.model = "sora-2";
  rec.batch.requested_count = count;
  rec.batch.unit_cost = unit;
  for (uint32_t i = 0; i < count; ++i) {
    genledger::Task t;
    t.id = genledger::make_record_id("tsk");
    t.batch_id = rec.batch.id;
    t.owner = owner;
    t.status = genledger::TaskStatus::queued;
    rec.tasks.push_back(t);
  }
  rec.debit.owner = owner;
  rec.debit.delta = -unit * count;
  rec.debit.reason = genledger::debit_reason(rec.batch.id);
  rec.debit.ref_batch_id = rec.batch.id;
  return rec;
}

void test_store_conditional_transition() {
  genledger::MemoryLedgerStore store;
  auto rec = make_admission("alice", 1, 15);
  expect(store.commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  expect(rec.debit.id != 0, "debit id assigned");
  const auto id = rec.tasks[0].id;
  using genledger::TaskStatus;
  expect(store.transition_task(id, {TaskStatus::pending, TaskStatus::queued}, TaskStatus::running,
                               {}, 1) == genledger::StoreStatus::ok,
         "first claim succeeds");
  expect(store.transition_task(id, {TaskStatus::pending, TaskStatus::queued}, TaskStatus::running,
                               {}, 2) == genledger::StoreStatus::conflict,
         "second claim observes zero rows");
  expect(store.transition_task(id, {TaskStatus::running}, TaskStatus::queued, {}, 3) ==
             genledger::StoreStatus::invalid_transition,
         "edge outside the graph refused");
  expect(store.transition_task("missing", {TaskStatus::queued}, TaskStatus::running, {}, 4) ==
             genledger::StoreStatus::not_found,
         "unknown task");

  genledger::TaskPatch stale;
  stale.expected_retries = 1;
  stale.progress = 60;
  expect(store.record_progress(id, stale, 5) == genledger::StoreStatus::conflict,
         "progress from another attempt refused");
  expect(store.transition_task(id, {TaskStatus::running}, TaskStatus::failed, stale, 6) ==
             genledger::StoreStatus::conflict,
         "finalize from another attempt refused");
  expect(store.get_task(id)->status == TaskStatus::running && store.get_task(id)->progress == 0,
         "task untouched by the other attempt");
  stale.expected_retries = 0;
  expect(store.record_progress(id, stale, 7) == genledger::StoreStatus::ok,
         "matching attempt writes");
}

void test_store_claim_exclusivity_threads() {
  genledger::MemoryLedgerStore store;
  auto rec = make_admission("alice", 1, 15);
  expect(store.commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  const auto id = rec.tasks[0].id;

  std::atomic<int> winners{0};
  std::atomic<int> losers{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      const auto st = store.transition_task(
          id, {genledger::TaskStatus::pending, genledger::TaskStatus::queued},
          genledger::TaskStatus::running, {}, 10);
      if (st == genledger::StoreStatus::ok) {
        winners++;
      } else if (st == genledger::StoreStatus::conflict) {
        losers++;
      }
    });
  }
  for (auto& t : threads) t.join();
  expect(winners.load() == 1, "exactly one claimant wins");
  expect(losers.load() == 15, "every other claimant observes a conflict");
}

void test_store_soft_delete_hides_tasks() {
  genledger::MemoryLedgerStore store;
  auto rec = make_admission("alice", 3, 15);
  expect(store.commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  expect(store.soft_delete_task(rec.tasks[0].id, 5) == genledger::StoreStatus::ok, "delete one");
  expect(store.soft_delete_task(rec.tasks[0].id, 6) == genledger::StoreStatus::not_found,
         "second delete is not_found");
  expect(store.tasks_for_batch(rec.batch.id).size() == 2, "deleted task hidden");
  const auto c = store.count_tasks_by_status(rec.batch.id);
  expect(c.total == 2 && c.queued == 2, "deleted task excluded from counts");
  expect(store.task_ids_with_status({genledger::TaskStatus::queued}).size() == 2,
         "deleted task excluded from queue rebuild");

  expect(store.soft_delete_batch(rec.batch.id, 7) == genledger::StoreStatus::ok, "delete batch");
  expect(store.tasks_for_batch(rec.batch.id).empty(), "batch tasks hidden");
  expect(store.count_batches("alice") == 0, "batch hidden from listings");
  expect(store.sum_deltas("alice") == -45, "transactions survive deletion");
}

// ============================================================================
// Phase 8: Credit ledger
// ============================================================================

void test_balance_is_sum_of_deltas() {
  genledger::MemoryLedgerStore store;
  ManualClock clock;
  genledger::CreditLedger ledger(store, clock.fn());
  expect(ledger.admin_adjust("alice", 100, "seed").ok, "credit");
  expect(ledger.admin_adjust("alice", -30, "correction").ok, "debit");
  expect(ledger.balance("alice") == 70, "balance = 100 - 30");
  int64_t sum = 0;
  for (const auto& tx : store.transactions_for("alice")) sum += tx.delta;
  expect(sum == ledger.balance("alice"), "balance equals Σ delta");
  expect(ledger.balance("nobody") == 0, "unknown owner has zero balance");
}

void test_admin_adjust_validation() {
  genledger::MemoryLedgerStore store;
  ManualClock clock;
  genledger::CreditLedger ledger(store, clock.fn());
  expect(!ledger.admin_adjust("alice", 0, "zero").ok, "zero delta rejected");
  expect(!ledger.admin_adjust("alice", 5, "").ok, "empty reason rejected");
  expect(!ledger.admin_adjust("alice", 5, std::string(65, 'x')).ok, "long reason rejected");
  expect(!ledger.admin_adjust("", 5, "x").ok, "owner required");
  expect(store.all_transactions().empty(), "rejections write nothing");
}

void test_refund_requires_failed_status() {
  genledger::MemoryLedgerStore store;
  ManualClock clock;
  genledger::CreditLedger ledger(store, clock.fn());
  auto rec = make_admission("alice", 1, 15);
  expect(store.commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  const auto r = ledger.refund_task(rec.tasks[0].id);
  expect(!r.ok && r.error_code == "not_refundable", "queued task is not refundable");
  expect(ledger.refund_task("missing").error_code == "not_found", "unknown task");
}

void test_refund_exclusivity_concurrent() {
  genledger::MemoryLedgerStore store;
  ManualClock clock;
  genledger::CreditLedger ledger(store, clock.fn());
  auto rec = make_admission("alice", 1, 15);
  expect(store.commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  const auto id = rec.tasks[0].id;
  using genledger::TaskStatus;
  store.transition_task(id, {TaskStatus::queued}, TaskStatus::running, {}, 1);
  store.transition_task(id, {TaskStatus::running}, TaskStatus::failed, {}, 2);

  std::atomic<int> refunded{0};
  std::atomic<int> deduped{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      const auto r = ledger.refund_task(id);
      if (r.refunded) refunded++;
      if (r.already_refunded) deduped++;
    });
  }
  for (auto& t : threads) t.join();
  expect(refunded.load() == 1, "exactly one refund written");
  expect(deduped.load() == 15, "every other attempt is a dedup hit");
  expect(positive_tx_for(store, id) == 1, "one positive transaction references the task");
  expect(ledger.balance("alice") == 0, "debit fully offset by one unit refund");
  expect(ledger.find_duplicate_refunds().empty(), "no duplicates");
  expect(ledger.verify_invariants().empty(), "ledger invariants hold");
}

void test_verify_invariants_detects_duplicate() {
  genledger::MemoryLedgerStore store;
  ManualClock clock;
  genledger::CreditLedger ledger(store, clock.fn());
  auto rec = make_admission("alice", 1, 15);
  expect(store.commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  // Bypass refund_task() to forge a double refund.
  for (int i = 0; i < 2; ++i) {
    genledger::CreditTransaction tx;
    tx.owner = "alice";
    tx.delta = 15;
    tx.reason = genledger::refund_reason(rec.tasks[0].id);
    tx.ref_batch_id = rec.batch.id;
    tx.ref_task_id = rec.tasks[0].id;
    store.append_transaction(tx);
  }
  const auto verdict = ledger.verify_invariants();
  expect(verdict.rfind("FAIL duplicate_refund", 0) == 0, "duplicate refund detected: " + verdict);
  expect(ledger.find_duplicate_refunds().size() == 1, "duplicate listed");
}

// ============================================================================
// Phase 9: Rate limiter
// ============================================================================

void test_sliding_window() {
  ManualClock clock;
  genledger::SlidingWindowLimiter lim(3, 60000, clock.fn());
  expect(lim.allow("a") && lim.allow("a") && lim.allow("a"), "three within limit");
  expect(!lim.allow("a"), "fourth rejected");
  expect(lim.allow("b"), "owners are independent");
  clock.advance(30000);
  expect(!lim.peek_allowed("a"), "still inside window");
  clock.advance(30000);
  expect(lim.peek_allowed("a"), "window slid past first stamps");
  expect(lim.in_window("a") == 0, "old stamps pruned");
  expect(lim.allow("a"), "accepted again");
  lim.reset();
  expect(lim.in_window("a") == 0 && lim.in_window("b") == 0, "reset forgets every owner");
}

void test_idle_owners_forgotten() {
  ManualClock clock;
  genledger::SlidingWindowLimiter lim(2, 1000, clock.fn());
  for (int i = 0; i < 100; ++i) lim.allow("o" + std::to_string(i));
  expect(lim.tracked_owners() == 100, "one entry per active owner");

  clock.advance(1000);
  expect(lim.in_window("o0") == 0, "expired owner reads empty");
  expect(lim.tracked_owners() == 99, "expired owner dropped on access");

  // Fresh owners eventually trigger a sweep of everyone who went quiet.
  for (int i = 0; i < 40; ++i) expect(lim.allow("n" + std::to_string(i)), "new owner admitted");
  expect(lim.tracked_owners() == 40, "only owners inside the window remain");

  genledger::SlidingWindowLimiter closed(0, 1000, clock.fn());
  expect(!closed.allow("x") && closed.tracked_owners() == 0, "rejections record nothing");
}

// ============================================================================
// Phase 10: Admission
// ============================================================================

void test_scenario_a_debit_and_queue() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 2);
  expect(r.ok && !r.replayed, "submission admitted");
  expect(r.total_cost == 30, "2 × 15");
  expect(h.svc.balance("alice") == 70, "balance 100 → 70");
  const auto tasks = h.tasks(r.batch_id);
  expect(tasks.size() == 2, "one task per requested unit");
  for (const auto& t : tasks) expect(t.status == genledger::TaskStatus::queued, "tasks queued");
  const auto batch = h.store.get_batch(r.batch_id);
  expect(batch && batch->counters.total == 2 && batch->counters.queued == 2,
         "aggregates recomputed at admission");
  expect(h.svc.scheduler().queue_depth() == 2, "task ids handed to the scheduler");
}

void test_scenario_c_idempotent_replay() {
  Harness h;
  h.fund("alice", 100);
  const auto first = h.submit("alice", 2, "key-1");
  expect(first.ok, "first submission");
  h.clock.advance(5000);
  const auto second = h.submit("alice", 2, "key-1");
  expect(second.ok && second.replayed, "second submission is a replay");
  expect(second.batch_id == first.batch_id, "same batch id returned");
  expect(h.svc.balance("alice") == 70, "debited once");
  expect(h.store.count_batches("alice") == 1, "one batch");
  expect(h.tasks(first.batch_id).size() == 2, "no new tasks");
  expect(h.svc.scheduler().queue_depth() == 2, "nothing new enqueued");

  // Same key, another owner: independent.
  h.fund("bob", 100);
  const auto other = h.submit("bob", 1, "key-1");
  expect(other.ok && !other.replayed && other.batch_id != first.batch_id,
         "keys are scoped per owner");
}

void test_replay_outside_window_admits_again() {
  Harness h;
  h.fund("alice", 100);
  const auto first = h.submit("alice", 1, "key-2");
  h.clock.advance(h.config.idempotency_window_ms + 1);
  const auto second = h.submit("alice", 1, "key-2");
  expect(second.ok && !second.replayed, "expired key admits a new batch");
  expect(second.batch_id != first.batch_id, "new batch id");
  expect(h.svc.balance("alice") == 70, "two debits");
}

void test_replay_after_delete() {
  Harness h;
  h.fund("alice", 100);
  const auto first = h.submit("alice", 1, "key-3");
  expect(h.svc.delete_batch("alice", first.batch_id).ok, "batch deleted");
  const auto again = h.submit("alice", 1, "key-3");
  expect(again.ok && again.replayed, "key inside its window still replays");
  expect(again.batch_id == first.batch_id, "prior batch id returned");
  expect(again.total_cost == first.total_cost, "prior cost reported");
  expect(h.svc.balance("alice") == 85, "no second debit");
  expect(!h.svc.list_tasks("alice", again.batch_id).result.ok, "deleted batch stays hidden");
}

void test_rejections_mutate_nothing() {
  genledger::Config c = test_config();
  c.rate_limit_per_window = 2;
  Harness h(c);
  h.fund("alice", 20);
  const size_t tx_before = h.store.all_transactions().size();

  auto r = h.submit("alice", 2);
  expect(!r.ok && r.error == genledger::SubmitError::insufficient_funds, "30 > 20");
  r = h.submit("alice", 0);
  expect(!r.ok && r.error == genledger::SubmitError::validation, "count 0");
  r = h.submit("alice", 51);
  expect(!r.ok && r.error == genledger::SubmitError::validation, "count 51");

  genledger::SubmitRequest bad;
  bad.params.prompt = "   \t ";
  bad.params.model = "sora-2";
  bad.params.orientation = "portrait";
  bad.params.size = "small";
  bad.params.duration_s = 10;
  r = h.svc.submit_batch("alice", bad);
  expect(!r.ok && r.error == genledger::SubmitError::validation, "blank prompt");
  bad.params.prompt = std::string(3001, 'x');
  r = h.svc.submit_batch("alice", bad);
  expect(!r.ok && r.error == genledger::SubmitError::validation, "prompt too long");
  bad.params.prompt = "ok";
  bad.params.duration_s = 25;
  r = h.svc.submit_batch("alice", bad);
  expect(!r.ok && r.error == genledger::SubmitError::validation, "25s not allowed for sora-2");

  expect(h.store.all_transactions().size() == tx_before, "no transaction written");
  expect(h.store.count_batches("alice") == 0, "no batch written");
  expect(h.svc.balance("alice") == 20, "balance untouched");
}

void test_rate_limit_admission() {
  genledger::Config c = test_config();
  c.rate_limit_per_window = 2;
  Harness h(c);
  h.fund("alice", 1000);
  expect(h.submit("alice", 1, "k1").ok, "first");
  expect(h.submit("alice", 1).ok, "second");
  const auto replay = h.submit("alice", 1, "k1");
  expect(replay.ok && replay.replayed, "replay is served without a rate slot");
  const auto third = h.submit("alice", 1);
  expect(!third.ok && third.error == genledger::SubmitError::rate_limited, "third rejected");
  expect(h.svc.balance("alice") == 970, "rate-limited submission not charged");
  h.clock.advance(c.rate_window_ms);
  expect(h.submit("alice", 1).ok, "accepted after the window slides");
}

void test_utf8_prompt_length() {
  expect(genledger::utf8_length("abc") == 3, "ascii");
  expect(genledger::utf8_length("\xC3\xA9t\xC3\xA9") == 3, "two-byte sequences count once");
  expect(genledger::utf8_length("\xF0\x9F\x8E\xA5") == 1, "four-byte sequence counts once");
}

// ============================================================================
// Phase 11: Scheduler / executor
// ============================================================================

void test_execution_success() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 2);
  h.drain();
  for (const auto& t : h.tasks(r.batch_id)) {
    expect(t.status == genledger::TaskStatus::completed, "task completed");
    expect(!t.result_locator.empty(), "locator stored");
    expect(!t.remote_job_handle.empty(), "job handle stored");
    expect(t.progress == 100, "progress 100");
  }
  const auto batch = h.store.get_batch(r.batch_id);
  expect(batch->counters.completed == 2 && batch->counters.total == 2, "aggregates follow");
  expect(h.svc.balance("alice") == 70, "no refund on success");
  expect(h.client.last_request().model == "sora-2", "generation params forwarded");
}

void test_scenario_b_failure_refunds_once() {
  Harness h;
  h.fund("alice", 100);
  h.client.script({Behavior::fail});
  const auto r = h.submit("alice", 2);
  expect(h.svc.balance("alice") == 70, "debited");
  h.drain();

  std::string failed_id;
  int completed = 0;
  for (const auto& t : h.tasks(r.batch_id)) {
    if (t.status == genledger::TaskStatus::failed) failed_id = t.id;
    if (t.status == genledger::TaskStatus::completed) ++completed;
  }
  expect(!failed_id.empty() && completed == 1, "one failed, one completed");
  const auto failed = h.store.get_task(failed_id);
  expect(failed->error_summary == "content policy violation", "provider reason stored");
  expect(h.svc.balance("alice") == 85, "refund restores one unit");

  // Re-run the refund path and sweeps.
  const auto again = h.svc.ledger().refund_task(failed_id);
  expect(again.ok && again.already_refunded && !again.refunded, "second refund is a no-op");
  h.svc.sweep();
  h.svc.sweep();
  expect(h.svc.balance("alice") == 85, "balance stays 85");
  expect(positive_tx_for(h.store, failed_id) == 1, "exactly one refund transaction");
  expect(h.svc.ledger().verify_invariants().empty(), "ledger invariants hold");
}

void test_create_errors_fail_and_refund() {
  Harness h;
  h.fund("alice", 100);
  h.client.script({Behavior::throw_on_create, Behavior::fail_create});
  const auto r = h.submit("alice", 2);
  h.drain();
  for (const auto& t : h.tasks(r.batch_id)) {
    expect(t.status == genledger::TaskStatus::failed, "create failure is terminal");
    expect(!t.error_summary.empty(), "reason recorded");
  }
  expect(h.svc.balance("alice") == 100, "both units refunded");
}

void test_poll_timeout() {
  genledger::Config c = test_config();
  c.max_poll_ms = 20;
  Harness h(c);
  h.fund("alice", 100);
  h.client.script({Behavior::hang});
  const uint64_t timeouts_before = genledger::global_stats().timeouts.load();
  const auto r = h.submit("alice", 1);
  h.drain();
  const auto t = h.tasks(r.batch_id).front();
  expect(t.status == genledger::TaskStatus::failed, "hung job fails");
  expect(t.error_summary.rfind("timeout", 0) == 0, "timeout reason: " + t.error_summary);
  expect(t.progress == 40, "last reported progress kept");
  expect(h.svc.balance("alice") == 100, "timeout refunded");
  expect(genledger::global_stats().timeouts.load() == timeouts_before + 1, "timeout counted");
}

void test_completed_without_url_keeps_polling() {
  genledger::Config c = test_config();
  c.max_poll_ms = 20;
  Harness h(c);
  h.fund("alice", 100);
  h.client.script({Behavior::complete_without_url});
  const auto r = h.submit("alice", 1);
  h.drain();
  const auto t = h.tasks(r.batch_id).front();
  expect(h.client.polls() > 1, "completed without a locator is not terminal");
  expect(t.status == genledger::TaskStatus::failed && t.error_summary.rfind("timeout", 0) == 0,
         "it ends as a timeout");
}

void test_error_summary_truncated() {
  expect(genledger::truncate_summary("abcdef", 3) == "abc", "plain cut");
  expect(genledger::truncate_summary("ab\xC3\xA9", 3) == "ab", "never splits a UTF-8 sequence");
  expect(genledger::truncate_summary("short", 500) == "short", "short text untouched");
}

void test_scenario_d_head_of_line_blocking() {
  genledger::Config c = test_config();
  c.global_concurrency = 2;
  c.per_owner_concurrency = 1;
  Harness h(c);
  h.fund("x", 100);
  h.fund("y", 100);
  h.client.close_gate();
  const auto bx = h.submit("x", 2);
  const auto by = h.submit("y", 1);
  auto& s = h.svc.scheduler();

  expect(s.tick() == genledger::TickResult::claimed, "x's first task claimed");
  expect(s.inflight_for("x") == 1, "x at its cap");
  for (int i = 0; i < 5; ++i) {
    expect(s.tick() == genledger::TickResult::deferred, "x's second task blocks the head");
  }
  expect(s.inflight() == 1, "global capacity remains");
  expect(s.inflight_for("y") == 0, "y does not start behind a blocked head");
  expect(h.store.get_task(h.tasks(by.batch_id).front().id)->status == genledger::TaskStatus::queued,
         "y's task still queued");
  expect(s.queue_depth() == 2, "nothing skipped");

  h.client.open_gate();
  h.drain();
  for (const auto& t : h.tasks(bx.batch_id)) {
    expect(t.status == genledger::TaskStatus::completed, "x's tasks finish");
  }
  expect(h.tasks(by.batch_id).front().status == genledger::TaskStatus::completed,
         "y's task finishes after the head clears");
}

void test_concurrency_caps_respected() {
  genledger::Config c = test_config();
  c.global_concurrency = 3;
  c.per_owner_concurrency = 2;
  Harness h(c);
  h.fund("x", 1000);
  h.fund("y", 1000);
  h.client.close_gate();
  h.submit("x", 4);
  h.submit("y", 4);
  auto& s = h.svc.scheduler();
  for (int i = 0; i < 20; ++i) s.tick();
  expect(s.inflight() <= 3, "global cap");
  expect(s.inflight_for("x") <= 2 && s.inflight_for("y") <= 2, "per-owner cap");
  expect(s.inflight() == 2, "x's third task blocks the head after two claims");
  h.client.open_gate();
  h.drain();
  expect(s.inflight() == 0, "all units exited");
}

void test_claim_conflict_drops_without_side_effects() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  // Another actor claims first.
  h.store.transition_task(id, {genledger::TaskStatus::queued}, genledger::TaskStatus::running, {}, 1);
  const auto tr = h.svc.scheduler().tick();
  expect(tr == genledger::TickResult::dropped, "not claimable head dropped");
  expect(h.svc.scheduler().queue_depth() == 0, "dropped from the queue");
  expect(h.svc.scheduler().inflight() == 0, "no unit launched");
  expect(h.client.creates() == 0, "provider untouched");
}

void test_cancel_in_flight_discards_result() {
  Harness h;
  h.fund("alice", 100);
  h.client.close_gate();
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  expect(h.svc.scheduler().tick() == genledger::TickResult::claimed, "claimed");
  expect(wait_until([&] { return h.client.waiting_at_gate() == 1; }), "unit reached the provider");
  expect(h.svc.cancel_task("alice", id).ok, "running task cancellable");
  h.client.open_gate();
  h.drain();
  const auto t = h.store.get_task(id);
  expect(t->status == genledger::TaskStatus::cancelled, "cancel wins; completion discarded");
  expect(h.svc.balance("alice") == 85, "cancelled tasks keep their debit");
  expect(positive_tx_for(h.store, id) == 0, "no refund for cancellation");
}

void test_cancel_before_claim_never_calls_provider() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  expect(h.svc.cancel_task("alice", id).ok, "queued task cancelled");
  h.drain();
  expect(h.client.creates() == 0, "provider never called");
  expect(h.store.get_task(id)->status == genledger::TaskStatus::cancelled, "stays cancelled");
}

void test_retry_requeues_without_recharge() {
  Harness h;
  h.fund("alice", 100);
  h.client.script({Behavior::fail});
  const auto r = h.submit("alice", 1);
  h.drain();
  const auto id = h.tasks(r.batch_id).front().id;
  expect(h.store.get_task(id)->status == genledger::TaskStatus::failed, "first attempt failed");
  expect(h.svc.balance("alice") == 100, "refunded");

  expect(!h.svc.retry_task("bob", id).ok, "other owner cannot retry");
  const auto rr = h.svc.retry_task("alice", id);
  expect(rr.ok, "retry accepted");
  auto t = h.store.get_task(id);
  expect(t->status == genledger::TaskStatus::queued, "back to queued");
  expect(t->error_summary.empty() && t->retries == 1, "error cleared, retries counted");

  h.drain();
  t = h.store.get_task(id);
  expect(t->status == genledger::TaskStatus::completed, "retry completed");
  expect(h.svc.balance("alice") == 100, "retry is not charged again");
  expect(positive_tx_for(h.store, id) == 1, "still one refund");

  const auto again = h.svc.retry_task("alice", id);
  expect(!again.ok && again.error_code == "invalid_state", "completed task cannot be retried");
}

void test_superseded_attempt_cannot_touch_retry() {
  Harness h;
  h.fund("alice", 100);
  h.client.script({Behavior::fail});
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  auto& s = h.svc.scheduler();

  h.client.hold(id + ":0");
  h.client.hold(id + ":1");
  expect(s.tick() == genledger::TickResult::claimed, "first attempt claimed");
  expect(wait_until([&] { return h.client.waiting_at_gate() == 1; }), "first attempt inside create");

  // The sweep gives up on the silent attempt and the owner retries.
  h.clock.advance(h.config.stale_running_ms + 1);
  const auto rep = h.svc.sweep();
  expect(rep.stale_failed == 1 && rep.refunds == 1, "silent attempt swept and refunded");
  expect(h.svc.retry_task("alice", id).ok, "retry accepted");
  expect(s.tick() == genledger::TickResult::claimed, "second attempt claimed");
  expect(wait_until([&] { return h.client.waiting_at_gate() == 2; }), "both attempts inside create");

  // The old attempt's job fails; none of that may land on the retry.
  h.client.release(id + ":0");
  expect(wait_until([&] { return s.inflight() == 1; }), "old attempt exits");
  auto t = h.store.get_task(id);
  expect(t->status == genledger::TaskStatus::running && t->retries == 1, "retry still running");
  expect(t->remote_job_handle.empty(), "old job handle not recorded on the retry");
  expect(positive_tx_for(h.store, id) == 1, "old attempt issues no second refund");

  h.client.release(id + ":1");
  h.drain();
  t = h.store.get_task(id);
  expect(t->status == genledger::TaskStatus::completed, "retry completes");
  expect(t->remote_job_handle == "job-1", "retry's own job handle");
  expect(t->result_locator == "https://cdn.example/job-1.mp4", "retry's own result");
  expect(h.svc.balance("alice") == 100, "one debit, one refund");
  expect(h.client.creates() == 2, "one remote job per attempt");
}

void test_restart_rebuilds_queue() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 3);
  // Simulate a restart: the volatile queue is gone.
  auto& s = h.svc.scheduler();
  expect(s.rebuild_queue() == 3, "pending/queued tasks re-enqueued");
  h.drain();
  for (const auto& t : h.tasks(r.batch_id)) {
    expect(t.status == genledger::TaskStatus::completed, "rebuilt queue executes");
  }
}

void test_scheduler_loop_runs() {
  Harness h;
  h.fund("alice", 200);
  h.svc.start();
  const auto r = h.submit("alice", 5);
  expect(wait_until([&] {
           const auto b = h.store.get_batch(r.batch_id);
           return b && b->counters.completed == 5;
         }),
         "background loop completes every task");
  h.svc.stop();
  expect(!h.svc.scheduler().running(), "loop stopped");
}

// ============================================================================
// Phase 12: Reconciler
// ============================================================================

void test_scenario_e_stale_running_swept() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  // A unit claimed the task and the process died.
  h.store.transition_task(id, {genledger::TaskStatus::queued}, genledger::TaskStatus::running, {},
                          h.clock.now->load());
  h.svc.scheduler().rebuild_queue();

  h.clock.advance(h.config.stale_running_ms / 2);
  auto rep = h.svc.sweep();
  expect(rep.stale_failed == 0, "not stale yet");

  h.clock.advance(h.config.stale_running_ms);
  rep = h.svc.sweep();
  expect(rep.stale_failed == 1 && rep.refunds == 1, "swept once with one refund");
  const auto t = h.store.get_task(id);
  expect(t->status == genledger::TaskStatus::failed, "stale task failed");
  expect(t->error_summary == "timeout: no provider update", "non-null reason");
  h.svc.sweep();
  expect(positive_tx_for(h.store, id) == 1, "exactly one refund across sweeps");
  expect(h.svc.balance("alice") == 100, "refunded");
}

void test_heartbeat_prevents_stale_sweep() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  h.store.transition_task(id, {genledger::TaskStatus::queued}, genledger::TaskStatus::running, {},
                          h.clock.now->load());
  h.clock.advance(h.config.stale_running_ms - 1000);
  genledger::TaskPatch p;
  p.progress = 50;
  expect(h.store.record_progress(id, p, h.clock.now->load()) == genledger::StoreStatus::ok,
         "progress recorded");
  h.clock.advance(2000);
  h.svc.sweep();
  expect(h.store.get_task(id)->status == genledger::TaskStatus::running,
         "recent progress keeps the task alive");
}

void test_heal_locator_without_status() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  h.store.transition_task(id, {genledger::TaskStatus::queued}, genledger::TaskStatus::running, {}, 1);
  genledger::TaskPatch p;
  p.result_locator = "https://cdn.example/done.mp4";
  h.store.record_progress(id, p, 2);
  // Crash here: locator written, status never flipped.
  const auto list = h.svc.list_tasks("alice", r.batch_id);
  expect(list.result.ok, "read succeeds");
  expect(list.tasks.front().status == genledger::TaskStatus::completed, "healed on read");
  expect(list.batch->counters.completed == 1, "aggregates reflect the heal");
  expect(h.svc.balance("alice") == 85, "heal moves no credits");
}

void test_refund_repair_after_crash() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  using genledger::TaskStatus;
  h.store.transition_task(id, {TaskStatus::queued}, TaskStatus::running, {}, 1);
  h.store.transition_task(id, {TaskStatus::running}, TaskStatus::failed, {}, 2);
  // Crash between the failed write and the refund.
  expect(h.svc.balance("alice") == 85, "refund missing");
  const auto rep = h.svc.sweep();
  expect(rep.refunds == 1, "sweep writes the missing refund");
  expect(h.svc.balance("alice") == 100, "balance restored");
  h.svc.sweep();
  expect(positive_tx_for(h.store, id) == 1, "still exactly one");
}

void test_aggregate_correctness() {
  Harness h;
  h.fund("alice", 1000);
  const auto r = h.submit("alice", 6);
  const auto tasks = h.tasks(r.batch_id);
  using genledger::TaskStatus;
  const uint64_t now = h.clock.now->load();
  h.store.transition_task(tasks[0].id, {TaskStatus::queued}, TaskStatus::running, {}, now);
  h.store.transition_task(tasks[1].id, {TaskStatus::queued}, TaskStatus::running, {}, now);
  h.store.transition_task(tasks[1].id, {TaskStatus::running}, TaskStatus::failed, {}, now);
  h.store.transition_task(tasks[2].id, {TaskStatus::queued}, TaskStatus::running, {}, now);
  genledger::TaskPatch done;
  done.result_locator = "https://x";
  h.store.transition_task(tasks[2].id, {TaskStatus::running}, TaskStatus::completed, done, now);
  h.store.transition_task(tasks[3].id, {TaskStatus::queued}, TaskStatus::cancelled, {}, now);
  h.store.soft_delete_task(tasks[4].id, now);

  h.svc.reconciler().reconcile_batch(r.batch_id);
  const auto b = h.store.get_batch(r.batch_id);
  const auto fresh = h.store.count_tasks_by_status(r.batch_id);
  expect(b->counters == fresh, "stored aggregates equal a fresh count");
  expect(b->counters.running == 1 && b->counters.failed == 1 && b->counters.completed == 1,
         "per-status counts");
  expect(b->counters.queued == 1, "deleted and cancelled excluded from queued");
  expect(b->counters.total == 4, "total excludes cancelled and deleted");
}

void test_background_reconciler() {
  genledger::Config c = test_config();
  c.stale_running_ms = 1000;
  Harness h(c);
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  h.store.transition_task(id, {genledger::TaskStatus::queued}, genledger::TaskStatus::running, {},
                          h.clock.now->load());
  h.clock.advance(5000);
  h.svc.reconciler().start();
  expect(wait_until([&] { return h.store.get_task(id)->status == genledger::TaskStatus::failed; }),
         "background sweep fails the stale task");
  h.svc.reconciler().stop();
  expect(!h.svc.reconciler().running(), "reconciler stopped");
}

// ============================================================================
// Phase 13: Service operations
// ============================================================================

void test_ownership_is_not_found() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  const auto id = h.tasks(r.batch_id).front().id;
  expect(h.svc.list_tasks("mallory", r.batch_id).result.error_code == "not_found", "list_tasks");
  expect(h.svc.get_task("mallory", id).result.error_code == "not_found", "get_task");
  expect(h.svc.cancel_task("mallory", id).error_code == "not_found", "cancel");
  expect(h.svc.delete_task("mallory", id).error_code == "not_found", "delete_task");
  expect(h.svc.delete_batch("mallory", r.batch_id).error_code == "not_found", "delete_batch");
  expect(h.store.get_task(id)->status == genledger::TaskStatus::queued, "untouched");
}

void test_list_batches_pagination() {
  Harness h;
  h.fund("alice", 1000);
  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(h.submit("alice", 1).batch_id);
    h.clock.advance(10);
  }
  auto page = h.svc.list_batches("alice", 1, 2);
  expect(page.result.ok && page.total == 5 && page.batches.size() == 2, "first page");
  expect(page.batches[0].id == ids[4], "newest first");
  page = h.svc.list_batches("alice", 3, 2);
  expect(page.batches.size() == 1 && page.batches[0].id == ids[0], "last page");
  expect(!h.svc.list_batches("alice", 1, 0).result.ok, "page_size 0 rejected");
  expect(!h.svc.list_batches("alice", 1, 51).result.ok, "page_size 51 rejected");
  expect(!h.svc.list_batches("alice", 0, 10).result.ok, "page 0 rejected");
}

void test_delete_batch_cancels_active() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 2);
  const auto tasks = h.tasks(r.batch_id);
  expect(h.svc.delete_batch("alice", r.batch_id).ok, "deleted");
  for (const auto& t : tasks) {
    const auto stored = h.store.get_task(t.id);
    expect(stored->status == genledger::TaskStatus::cancelled, "active task cancelled first");
    expect(stored->deleted(), "task soft-deleted");
  }
  expect(h.svc.list_batches("alice", 1, 10).total == 0, "hidden from listings");
  h.drain();
  expect(h.client.creates() == 0, "queued ids of a deleted batch are dropped");
  expect(h.svc.balance("alice") == 70, "deletion does not refund");
  expect(!h.svc.delete_batch("alice", r.batch_id).ok, "second delete is not_found");
}

void test_delete_task_recomputes() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 2);
  const auto id = h.tasks(r.batch_id).front().id;
  expect(h.svc.delete_task("alice", id).ok, "deleted");
  const auto b = h.store.get_batch(r.batch_id);
  expect(b->counters.total == 1 && b->counters.queued == 1, "aggregates exclude the deleted task");
}

void test_cancel_terminal_task_rejected() {
  Harness h;
  h.fund("alice", 100);
  const auto r = h.submit("alice", 1);
  h.drain();
  const auto id = h.tasks(r.batch_id).front().id;
  const auto c = h.svc.cancel_task("alice", id);
  expect(!c.ok && c.error_code == "invalid_state", "completed task cannot be cancelled");
}

// ============================================================================
// Phase 14: Journal durability
// ============================================================================

void test_journal_reopen_restores_state() {
  const auto path = temp_path("reopen.ndjson");
  std::string batch_id;
  {
    auto opened = genledger::MemoryLedgerStore::open(path.string());
    expect(opened.ok, "fresh journal opens");
    FakeClient client;
    genledger::PriceTable prices;
    ManualClock clock;
    genledger::Config cfg = test_config();
    genledger::LedgerService svc(*opened.store, client, prices, cfg, clock.fn());
    svc.admin_adjust("alice", 100, "seed");
    client.script({Behavior::fail});
    genledger::SubmitRequest req;
    req.params = {"prompt", "sora-2", "portrait", "small", 10, ""};
    req.count = 2;
    req.idempotency_key = "persisted";
    const auto r = svc.submit_batch("alice", req);
    expect(r.ok, "submitted");
    batch_id = r.batch_id;
    auto& s = svc.scheduler();
    while (s.tick() != genledger::TickResult::idle) {
    }
    expect(s.wait_idle(std::chrono::milliseconds(5000)), "drained");
    expect(svc.balance("alice") == 85, "one refund before restart");
  }

  auto reopened = genledger::MemoryLedgerStore::open(path.string());
  expect(reopened.ok, "journal replays");
  expect(reopened.replay.entries > 0, "entries replayed");
  auto& store = *reopened.store;
  expect(store.sum_deltas("alice") == 85, "balance survives restart");
  expect(store.tasks_for_batch(batch_id).size() == 2, "tasks survive restart");
  expect(store.get_idempotency("alice", "persisted").has_value(), "idempotency key survives");
  ManualClock clock;
  genledger::CreditLedger ledger(store, clock.fn());
  expect(ledger.verify_invariants().empty(), "invariants hold after replay");
  expect(store.journal_sequence() == reopened.replay.last_sequence, "sequence resumes from replay");

  // New appends continue the chain.
  expect(ledger.admin_adjust("alice", 5, "bonus").ok, "append after reopen");
  expect(store.journal_sequence() == reopened.replay.last_sequence + 1, "append advances sequence");
  auto third = genledger::MemoryLedgerStore::open(path.string());
  expect(third.ok && third.store->sum_deltas("alice") == 90, "chain continues across restarts");
  fs::remove(path);
}

void test_journal_torn_tail_cut() {
  const auto path = temp_path("torn.ndjson");
  {
    auto opened = genledger::MemoryLedgerStore::open(path.string());
    ManualClock clock;
    genledger::CreditLedger ledger(*opened.store, clock.fn());
    ledger.admin_adjust("alice", 100, "seed");
  }
  const auto good_size = fs::file_size(path);
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    ofs << "{\"v\":1,\"seq\":2,\"prev\":\"abc";
  }
  auto reopened = genledger::MemoryLedgerStore::open(path.string());
  expect(reopened.ok, "torn tail tolerated");
  expect(reopened.replay.torn_tail, "torn tail reported");
  expect(fs::file_size(path) == good_size, "torn bytes cut");
  expect(reopened.store->sum_deltas("alice") == 100, "complete lines applied");
  fs::remove(path);
}

void test_journal_chain_break_detected() {
  const auto path = temp_path("chain.ndjson");
  {
    auto opened = genledger::MemoryLedgerStore::open(path.string());
    ManualClock clock;
    genledger::CreditLedger ledger(*opened.store, clock.fn());
    ledger.admin_adjust("alice", 100, "seed");
    ledger.admin_adjust("alice", 1, "second");
  }
  std::string text;
  {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    text = ss.str();
  }
  const auto at = text.find("seed");
  expect(at != std::string::npos, "first line located");
  text.replace(at, 4, "SEED");
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << text;
  }
  auto reopened = genledger::MemoryLedgerStore::open(path.string());
  expect(!reopened.ok, "tampered journal refused");
  expect(reopened.error_code == "journal_chain_broken", "chain break: " + reopened.error_code);
  fs::remove(path);
}

// ============================================================================
// Phase 15: Process provider adapter
// ============================================================================

void test_process_client_protocol() {
#ifndef _WIN32
  const auto script = temp_path("provider.sh");
  {
    std::ofstream ofs(script);
    ofs << "#!/bin/sh\n"
        << "if [ \"$1\" = \"create\" ]; then echo '{\"id\":\"job-77\"}'; exit 0; fi\n"
        << "if [ \"$1\" = \"poll\" ] && [ \"$2\" = \"job-77\" ]; then\n"
        << "  echo '{\"data\":{\"status\":\"SUCCESS\",\"video_url\":\"https://cdn/v.mp4\"}}'; exit 0\n"
        << "fi\n"
        << "echo 'no such job' >&2; exit 3\n";
  }
  fs::permissions(script, fs::perms::owner_all);

  genledger::ProcessJobClient client(script.string(), 5000);
  genledger::CreateJobRequest req;
  req.prompt = "it's \"quoted\"; $(not a shell)";
  req.model = "sora-2";
  const auto c = client.create(req);
  expect(c.ok && c.job_handle == "job-77", "create through the process protocol");
  const auto p = client.poll("job-77");
  expect(p.ok && p.status == genledger::RemoteStatus::completed, "poll parsed");
  expect(p.result_locator == "https://cdn/v.mp4", "locator parsed");
  const auto bad = client.poll("job-0");
  expect(!bad.ok && bad.error.find("exit 3") != std::string::npos, "non-zero exit is an error");
  expect(bad.error.find("no such job") != std::string::npos, "stderr carried into the error");
  fs::remove(script);
#endif
}

void test_process_timeout() {
#ifndef _WIN32
  genledger::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 5"};
  spec.timeout_ms = 50;
  const auto r = genledger::run_process(spec);
  expect(r.timed_out && r.exit_code == 124, "timeout kills the provider process");

  genledger::ProcessJobClient missing("/nonexistent/provider", 1000);
  const auto c = missing.create(genledger::CreateJobRequest{});
  expect(!c.ok && c.error.find("exit 127") != std::string::npos, "exec failure surfaces");
#endif
}

// ============================================================================
// Phase 16: Observability
// ============================================================================

void test_event_hook_and_stats() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  genledger::global_stats().reset();
  genledger::set_event_hook(&capture_event);
  Harness h;
  h.fund("alice", 100);
  h.client.script({Behavior::fail});
  h.submit("alice", 1);
  h.submit("alice", 1, "");
  h.drain();
  genledger::set_event_hook(nullptr);

  expect(count_events(genledger::EventKind::admitted) == 2, "admissions emitted");
  expect(count_events(genledger::EventKind::claimed) == 2, "claims emitted");
  expect(count_events(genledger::EventKind::failed) == 1, "failure emitted");
  expect(count_events(genledger::EventKind::refund) == 1, "refund emitted");
  expect(count_events(genledger::EventKind::completed) == 1, "completion emitted");
  expect(genledger::global_stats().admissions.load() == 2, "admissions counted");
  expect(genledger::global_stats().refunds.load() == 1, "refund counted");
  expect(genledger::global_stats().execution_latency.count() == 2, "both units timed");

  const auto json = genledger::global_stats().to_json();
  std::optional<genledger::jsonlite::JsonError> err;
  const auto obj = genledger::jsonlite::parse(json, &err);
  expect(!err, "stats JSON parses");
  expect(genledger::jsonlite::has(obj, "refunds"), "refunds counter exported");
  expect(genledger::jsonlite::has(obj, "claim_conflicts"), "claim conflict counter exported");
}

void test_event_json_has_no_prompt() {
  genledger::LedgerEvent ev;
  ev.kind = genledger::EventKind::refund;
  ev.owner = "alice";
  ev.task_id = "tsk_1";
  ev.delta = 15;
  const auto json = genledger::event_to_json(ev);
  expect(genledger::jsonlite::validate_strict(json) == std::nullopt, "event JSON strict");
  expect(json.find("\"kind\":\"refund\"") != std::string::npos, "kind serialized");
}

void test_latency_histogram() {
  genledger::LatencyHistogram hist;
  for (int i = 0; i < 100; ++i) hist.record(static_cast<uint64_t>(i) * 1000000ULL);
  expect(hist.count() == 100, "count");
  expect(hist.percentile(0.5) <= hist.percentile(0.99), "percentiles ordered");
  hist.reset();
  expect(hist.count() == 0, "reset");
}

void test_worker_identity() {
  const auto id = genledger::init_worker_identity("w-test", "node-a");
  expect(!id.worker_id.empty() && !id.node_id.empty(), "identity populated");
  const auto json = genledger::worker_identity_to_json(id);
  expect(!genledger::jsonlite::validate_strict(json), "identity JSON strict");
  Harness h;
  const auto health = genledger::worker_health_snapshot(&h.svc.scheduler(), 10);
  expect(health.inflight == 0 && health.utilization_pct == 0.0, "idle health");
  expect(!genledger::jsonlite::validate_strict(genledger::worker_health_to_json(health)),
         "health JSON strict");
}

void test_version_manifest() {
  const auto m = genledger::version::current_manifest("1.2.3");
  expect(m.semver == "1.2.3", "semver carried");
  expect(m.journal_format == genledger::version::JOURNAL_FORMAT_VERSION, "journal version");
  expect(!genledger::jsonlite::validate_strict(genledger::version::manifest_to_json(m)),
         "manifest JSON strict");
}

// ============================================================================
// Phase 17: Frame protocol
// ============================================================================

genledger::jsonlite::Object frame(genledger::LedgerService& svc, const std::string& line) {
  std::optional<genledger::jsonlite::JsonError> err;
  const auto out = genledger::jsonlite::parse(genledger::handle_frame(svc, line), &err);
  expect(!err, "response frame is valid JSON");
  return out;
}

std::string frame_error(const genledger::jsonlite::Object& resp) {
  return genledger::jsonlite::get_string(genledger::jsonlite::get_object(resp, "error"), "code");
}

void test_frame_submit_and_list() {
  namespace jl = genledger::jsonlite;
  Harness h;
  h.fund("alice", 100);
  const auto sub = frame(h.svc,
                         R"({"id":"r1","op":"submit","owner":"alice","prompt":"a lighthouse at dusk",)"
                         R"("count":2,"duration":10,"idempotency_key":"k1"})");
  expect(jl::get_bool(sub, "ok"), "submit accepted");
  expect(jl::get_string(sub, "id") == "r1", "request id echoed");
  expect(jl::get_u64(sub, "total_cost") == 30, "two tasks at 15");
  const std::string batch_id = jl::get_string(sub, "batch_id");
  expect(!batch_id.empty() && !jl::get_bool(sub, "replayed"), "new batch");

  const auto list =
      frame(h.svc, R"({"op":"list_tasks","owner":"alice","batch_id":")" + batch_id + R"("})");
  expect(jl::get_bool(list, "ok") && jl::get_array(list, "tasks").size() == 2, "tasks listed");
  const auto other =
      frame(h.svc, R"({"op":"list_tasks","owner":"bob","batch_id":")" + batch_id + R"("})");
  expect(frame_error(other) == "not_found", "foreign batch hidden");

  const auto bal = frame(h.svc, R"({"op":"balance","owner":"alice"})");
  expect(jl::get_i64(bal, "balance") == 70, "debit visible through the frame");

  const auto stats = frame(h.svc, R"({"op":"stats"})");
  expect(jl::get_u64(jl::get_object(stats, "store"), "journal_sequence") == 0, "no journal attached");
}

void test_frame_numeric_validation() {
  Harness h;
  h.fund("alice", 1000000);
  const std::string head = R"({"op":"submit","owner":"alice","prompt":"waves",)";
  const std::vector<std::string> bad = {
      R"("count":4294967297})",     // 2^32 + 1
      R"("count":-3})",
      R"("count":"50"})",
      R"("count":2.5})",
      R"("duration":4294967306})",  // 2^32 + 10
      R"("duration":null})",
  };
  for (const auto& tail : bad) {
    const auto resp = frame(h.svc, head + tail);
    expect(!genledger::jsonlite::get_bool(resp, "ok"), "rejected: " + tail);
    expect(frame_error(resp) == "validation", "validation error for " + tail);
  }
  expect(h.svc.balance("alice") == 1000000, "nothing debited");
  expect(h.svc.list_batches("alice", 1, 20).total == 0, "no batch created");

  expect(frame_error(frame(h.svc, R"({"op":"list_batches","owner":"alice","page_size":-1})")) ==
             "validation",
         "negative page size rejected");
  expect(frame_error(frame(h.svc, R"({"op":"adjust","owner":"alice","delta":"10"})")) == "validation",
         "string delta rejected");
  expect(frame_error(frame(h.svc, head + R"("count":0})")) == "validation",
         "zero count reaches admission validation");
}

void test_frame_errors() {
  Harness h;
  const auto unknown = frame(h.svc, R"({"id":"x9","op":"launch"})");
  expect(frame_error(unknown) == "unknown_op", "unknown op");
  expect(genledger::jsonlite::get_string(unknown, "id") == "x9", "id echoed on errors");
  expect(frame_error(frame(h.svc, "{not json")) == "bad_frame", "malformed line");
  expect(frame_error(frame(h.svc, R"({"op":"balance"})")) == "validation", "owner required");
}

void test_verify_journal_exit_codes() {
  namespace jl = genledger::jsonlite;
  const auto path = temp_path("verify.ndjson");
  genledger::AdmissionRecord rec = make_admission("alice", 1, 15);
  {
    auto opened = genledger::MemoryLedgerStore::open(path.string());
    expect(opened.ok, "journal opens");
    ManualClock clock;
    genledger::CreditLedger ledger(*opened.store, clock.fn());
    expect(ledger.admin_adjust("alice", 100, "seed").ok, "seeded");
    expect(opened.store->commit_admission(rec) == genledger::StoreStatus::ok, "admission commits");
  }
  const auto good = genledger::verify_journal(path.string());
  expect(good.exit_code == 0, "intact journal verifies: " + good.report_json);
  std::optional<jl::JsonError> err;
  auto report = jl::parse(good.report_json, &err);
  expect(!err && jl::get_bool(report, "ok"), "report says ok");

  {
    // Two refunds for one task, written straight to the store.
    auto opened = genledger::MemoryLedgerStore::open(path.string());
    expect(opened.ok, "journal reopens");
    for (int i = 0; i < 2; ++i) {
      genledger::CreditTransaction tx;
      tx.owner = "alice";
      tx.delta = 15;
      tx.reason = genledger::refund_reason(rec.tasks[0].id);
      tx.ref_batch_id = rec.batch.id;
      tx.ref_task_id = rec.tasks[0].id;
      expect(opened.store->append_transaction(tx) == genledger::StoreStatus::ok, "refund written");
    }
  }
  const auto size_before = fs::file_size(path);
  const auto bad = genledger::verify_journal(path.string());
  expect(bad.exit_code == 2, "duplicate refund fails verification");
  report = jl::parse(bad.report_json, &err);
  expect(!err && !jl::get_bool(report, "ok"), "report says not ok");
  expect(jl::get_string(report, "violation").rfind("FAIL duplicate_refund", 0) == 0, "violation named");
  expect(fs::file_size(path) == size_before, "verification never writes");
  fs::remove(path);
}

}  // namespace

int main() {
  genledger::set_log_level(genledger::LogLevel::error);
  genledger::set_event_log_path("");

  std::cout << "\n[Phase 1] Hashing and identifiers\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("record ids unique", test_record_ids_unique);

  std::cout << "\n[Phase 2] Task state machine\n";
  run_test("transition graph", test_transition_graph);
  run_test("task JSON roundtrip", test_task_json_roundtrip);

  std::cout << "\n[Phase 3] JSON codec\n";
  run_test("strict parsing", test_jsonlite_strict);
  run_test("extractors", test_jsonlite_extractors);

  std::cout << "\n[Phase 4] Configuration\n";
  run_test("defaults valid", test_config_defaults_valid);
  run_test("JSON errors", test_config_json_errors);
  run_test("env overrides", test_config_env_override);

  std::cout << "\n[Phase 5] Pricing table\n";
  run_test("default prices", test_pricing_defaults);
  run_test("per-model allow-list", test_pricing_allow_list);
  run_test("price table parse", test_pricing_parse);

  std::cout << "\n[Phase 6] Remote job client contract\n";
  run_test("status mapping", test_status_mapping);
  run_test("poll response fallbacks", test_poll_response_fallbacks);
  run_test("create response and request", test_create_response_and_request);

  std::cout << "\n[Phase 7] Ledger store\n";
  run_test("conditional transition", test_store_conditional_transition);
  run_test("claim exclusivity: 16 threads", test_store_claim_exclusivity_threads);
  run_test("soft delete hides tasks", test_store_soft_delete_hides_tasks);

  std::cout << "\n[Phase 8] Credit ledger\n";
  run_test("balance is Σ delta", test_balance_is_sum_of_deltas);
  run_test("admin adjust validation", test_admin_adjust_validation);
  run_test("refund requires failed status", test_refund_requires_failed_status);
  run_test("refund exclusivity: 16 threads", test_refund_exclusivity_concurrent);
  run_test("invariant check detects duplicate refund", test_verify_invariants_detects_duplicate);

  std::cout << "\n[Phase 9] Rate limiter\n";
  run_test("sliding window", test_sliding_window);
  run_test("idle owners forgotten", test_idle_owners_forgotten);

  std::cout << "\n[Phase 10] Admission\n";
  run_test("scenario A: debit and queue", test_scenario_a_debit_and_queue);
  run_test("scenario C: idempotent replay", test_scenario_c_idempotent_replay);
  run_test("replay outside window", test_replay_outside_window_admits_again);
  run_test("replay after delete", test_replay_after_delete);
  run_test("rejections mutate nothing", test_rejections_mutate_nothing);
  run_test("rate limit", test_rate_limit_admission);
  run_test("UTF-8 prompt length", test_utf8_prompt_length);

  std::cout << "\n[Phase 11] Scheduler / executor\n";
  run_test("execution success", test_execution_success);
  run_test("scenario B: failure refunds once", test_scenario_b_failure_refunds_once);
  run_test("create errors fail and refund", test_create_errors_fail_and_refund);
  run_test("poll timeout", test_poll_timeout);
  run_test("completed without url keeps polling", test_completed_without_url_keeps_polling);
  run_test("error summary truncation", test_error_summary_truncated);
  run_test("scenario D: head-of-line blocking", test_scenario_d_head_of_line_blocking);
  run_test("concurrency caps", test_concurrency_caps_respected);
  run_test("claim conflict drops", test_claim_conflict_drops_without_side_effects);
  run_test("cancel in flight discards result", test_cancel_in_flight_discards_result);
  run_test("cancel before claim", test_cancel_before_claim_never_calls_provider);
  run_test("retry requeues without recharge", test_retry_requeues_without_recharge);
  run_test("superseded attempt cannot touch the retry", test_superseded_attempt_cannot_touch_retry);
  run_test("restart rebuilds queue", test_restart_rebuilds_queue);
  run_test("scheduler loop", test_scheduler_loop_runs);

  std::cout << "\n[Phase 12] Reconciler\n";
  run_test("scenario E: stale running swept", test_scenario_e_stale_running_swept);
  run_test("heartbeat prevents stale sweep", test_heartbeat_prevents_stale_sweep);
  run_test("heal locator without status", test_heal_locator_without_status);
  run_test("refund repair after crash", test_refund_repair_after_crash);
  run_test("aggregate correctness", test_aggregate_correctness);
  run_test("background reconciler", test_background_reconciler);

  std::cout << "\n[Phase 13] Service operations\n";
  run_test("ownership is not_found", test_ownership_is_not_found);
  run_test("list batches pagination", test_list_batches_pagination);
  run_test("delete batch cancels active", test_delete_batch_cancels_active);
  run_test("delete task recomputes", test_delete_task_recomputes);
  run_test("cancel terminal task rejected", test_cancel_terminal_task_rejected);

  std::cout << "\n[Phase 14] Journal durability\n";
  run_test("reopen restores state", test_journal_reopen_restores_state);
  run_test("torn tail cut", test_journal_torn_tail_cut);
  run_test("chain break detected", test_journal_chain_break_detected);

  std::cout << "\n[Phase 15] Process provider adapter\n";
  run_test("process protocol", test_process_client_protocol);
  run_test("process timeout", test_process_timeout);

  std::cout << "\n[Phase 16] Observability\n";
  run_test("event hook and stats", test_event_hook_and_stats);
  run_test("event JSON", test_event_json_has_no_prompt);
  run_test("latency histogram", test_latency_histogram);
  run_test("worker identity", test_worker_identity);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 17] Frame protocol\n";
  run_test("submit and list through frames", test_frame_submit_and_list);
  run_test("numeric members range-checked", test_frame_numeric_validation);
  run_test("error frames", test_frame_errors);
  run_test("verify exit codes", test_verify_journal_exit_codes);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
