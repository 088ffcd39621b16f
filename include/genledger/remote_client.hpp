#pragma once

// genledger/remote_client.hpp — Remote Job Client contract.
//
// The provider runs the actual generation. This side only creates a job and
// polls it. Provider status strings are loosely typed and change without
// notice, so they pass through map_remote_status(): an exhaustive table with
// a non-terminal fallback. An unrecognized string is in_progress, never
// failed, so a provider API change cannot mass-fail (and mass-refund) jobs.
//
// Implementations report errors in the result structs. A client that throws
// is tolerated: the scheduler converts the exception into a provider_error.

#include <cstdint>
#include <optional>
#include <string>

namespace genledger {

enum class RemoteStatus {
  pending,
  queued,
  in_progress,
  completed,
  failed,
  cancelled,
};

std::string to_string(RemoteStatus s);

// Case-insensitive; spaces are treated as '-'. Unknown → in_progress.
RemoteStatus map_remote_status(const std::string& raw);

bool is_terminal(RemoteStatus s);

struct CreateJobRequest {
  std::string prompt;
  std::string media_reference;     // optional
  std::string model;
  std::string orientation;
  std::string size;
  uint32_t    duration_s{0};
  std::string idempotency_key;     // optional; provider-side dedup, best effort
};

struct CreateJobResult {
  bool        ok{false};
  std::string job_handle;
  std::string error;
};

struct PollResult {
  bool                    ok{false};     // false = the poll itself failed
  RemoteStatus            status{RemoteStatus::in_progress};
  std::string             raw_status;
  std::string             result_locator;
  std::string             error;
  std::optional<uint32_t> progress;
  uint64_t                remote_started_at_ms{0};
  uint64_t                remote_finished_at_ms{0};
};

// ---------------------------------------------------------------------------
// IRemoteJobClient — abstract provider adapter
// ---------------------------------------------------------------------------
// Thread-safety: implementations MUST be safe for concurrent calls; one
// scheduler runs many execution units against the same client.
class IRemoteJobClient {
 public:
  virtual ~IRemoteJobClient() = default;

  virtual CreateJobResult create(const CreateJobRequest& req) = 0;
  virtual PollResult poll(const std::string& job_handle) = 0;

  // Human-readable identifier for diagnostics.
  virtual std::string client_id() const = 0;
};

// ---------------------------------------------------------------------------
// Wire helpers shared by provider adapters
// ---------------------------------------------------------------------------

// {"model":...,"prompt":...,"orientation":...,"size":...,"duration":N,
//  "images":[...],"idempotency_key":...}
std::string create_request_to_json(const CreateJobRequest& req);

// Handle from "id", then "task_id", then data.id.
CreateJobResult parse_create_response(const std::string& json);

// status:   data.status, then status (lower-cased, mapped)
// locator:  data.video_url, then video_url, then result_url
// error:    error, then message, then fail_reason (then data.* of the same)
// progress: data.progress / progress, integer 0..100 or "NN%"
// times:    started_at / finished_at (data.* first); seconds or milliseconds
PollResult parse_poll_response(const std::string& json);

}  // namespace genledger
