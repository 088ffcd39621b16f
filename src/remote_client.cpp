#include "genledger/remote_client.hpp"

#include "genledger/jsonlite.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace genledger {

namespace {

// Exhaustive provider vocabulary. Anything absent maps to in_progress.
const std::pair<const char*, RemoteStatus> kStatusTable[] = {
    {"success",     RemoteStatus::completed},
    {"succeeded",   RemoteStatus::completed},
    {"completed",   RemoteStatus::completed},
    {"failed",      RemoteStatus::failed},
    {"failure",     RemoteStatus::failed},
    {"error",       RemoteStatus::failed},
    {"cancelled",   RemoteStatus::cancelled},
    {"canceled",    RemoteStatus::cancelled},
    {"pending",     RemoteStatus::pending},
    {"queued",      RemoteStatus::queued},
    {"in-progress", RemoteStatus::in_progress},
    {"in_progress", RemoteStatus::in_progress},
    {"processing",  RemoteStatus::in_progress},
    {"running",     RemoteStatus::in_progress},
};

std::string lower_dashed(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    out += (c == ' ') ? '-' : static_cast<char>(std::tolower(c));
  }
  return out;
}

// First non-empty string among `keys`, looking in `data` before `top`.
std::string first_string(const jsonlite::Object& data, const jsonlite::Object& top,
                         std::initializer_list<const char*> keys, bool data_first) {
  const jsonlite::Object* order[2] = {data_first ? &data : &top, data_first ? &top : &data};
  for (const auto* obj : order) {
    for (const char* k : keys) {
      std::string v = jsonlite::get_string(*obj, k);
      if (!v.empty()) return v;
    }
  }
  return "";
}

std::optional<uint32_t> read_progress(const jsonlite::Object& obj) {
  auto it = obj.find("progress");
  if (it == obj.end()) return std::nullopt;
  const auto& v = it->second.v;
  if (std::holds_alternative<std::uint64_t>(v)) {
    return static_cast<uint32_t>(std::min<std::uint64_t>(std::get<std::uint64_t>(v), 100));
  }
  if (std::holds_alternative<double>(v)) {
    const double d = std::get<double>(v);
    if (d < 0) return 0u;
    // Fractions in [0, 1] are ratios; larger values are already percentages.
    const double pct = d <= 1.0 ? d * 100.0 : d;
    return static_cast<uint32_t>(std::min(pct, 100.0));
  }
  if (std::holds_alternative<std::string>(v)) {
    const auto& s = std::get<std::string>(v);
    uint32_t n = 0;
    bool any = false;
    for (char c : s) {
      if (c < '0' || c > '9') break;
      n = n * 10 + static_cast<uint32_t>(c - '0');
      any = true;
      if (n > 100) break;
    }
    if (any) return std::min<uint32_t>(n, 100);
  }
  return std::nullopt;
}

// Provider timestamps arrive in seconds or milliseconds.
uint64_t read_time_ms(const jsonlite::Object& data, const jsonlite::Object& top,
                      std::initializer_list<const char*> keys) {
  for (const auto* obj : {&data, &top}) {
    for (const char* k : keys) {
      const uint64_t v = jsonlite::get_u64(*obj, k, 0);
      if (v == 0) continue;
      return v < 100000000000ULL ? v * 1000 : v;
    }
  }
  return 0;
}

}  // namespace

std::string to_string(RemoteStatus s) {
  switch (s) {
    case RemoteStatus::pending:     return "pending";
    case RemoteStatus::queued:      return "queued";
    case RemoteStatus::in_progress: return "in-progress";
    case RemoteStatus::completed:   return "completed";
    case RemoteStatus::failed:      return "failed";
    case RemoteStatus::cancelled:   return "cancelled";
  }
  return "in-progress";
}

RemoteStatus map_remote_status(const std::string& raw) {
  const std::string key = lower_dashed(raw);
  for (const auto& [name, status] : kStatusTable) {
    if (key == name) return status;
  }
  return RemoteStatus::in_progress;
}

bool is_terminal(RemoteStatus s) {
  return s == RemoteStatus::completed || s == RemoteStatus::failed || s == RemoteStatus::cancelled;
}

std::string create_request_to_json(const CreateJobRequest& req) {
  std::ostringstream o;
  o << "{\"model\":\"" << jsonlite::escape(req.model) << "\""
    << ",\"prompt\":\"" << jsonlite::escape(req.prompt) << "\""
    << ",\"orientation\":\"" << jsonlite::escape(req.orientation) << "\""
    << ",\"size\":\"" << jsonlite::escape(req.size) << "\""
    << ",\"duration\":" << req.duration_s
    << ",\"images\":[";
  if (!req.media_reference.empty()) o << "\"" << jsonlite::escape(req.media_reference) << "\"";
  o << "]";
  if (!req.idempotency_key.empty()) {
    o << ",\"idempotency_key\":\"" << jsonlite::escape(req.idempotency_key) << "\"";
  }
  o << "}";
  return o.str();
}

CreateJobResult parse_create_response(const std::string& json) {
  CreateJobResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) {
    r.error = "create response: " + err->code + ": " + err->message;
    return r;
  }
  const auto data = jsonlite::get_object(obj, "data");
  r.job_handle = first_string(data, obj, {"id", "task_id"}, false);
  if (r.job_handle.empty()) {
    r.error = first_string(data, obj, {"error", "message", "fail_reason"}, false);
    if (r.error.empty()) r.error = "create response carries no job id";
    return r;
  }
  r.ok = true;
  return r;
}

PollResult parse_poll_response(const std::string& json) {
  PollResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) {
    r.error = "poll response: " + err->code + ": " + err->message;
    return r;
  }
  const auto data = jsonlite::get_object(obj, "data");

  r.raw_status = first_string(data, obj, {"status"}, true);
  r.status = map_remote_status(r.raw_status);
  r.result_locator = first_string(data, obj, {"video_url", "result_url"}, true);
  // Top-level "video_url" wins over top-level "result_url"; data.video_url wins over both.
  if (const auto top_video = jsonlite::get_string(obj, "video_url");
      jsonlite::get_string(data, "video_url").empty() && !top_video.empty()) {
    r.result_locator = top_video;
  }
  r.error = first_string(data, obj, {"error", "message", "fail_reason"}, false);

  r.progress = read_progress(data);
  if (!r.progress) r.progress = read_progress(obj);
  r.remote_started_at_ms = read_time_ms(data, obj, {"started_at", "start_time"});
  r.remote_finished_at_ms = read_time_ms(data, obj, {"finished_at", "completed_at", "finish_time"});
  r.ok = true;
  return r;
}

}  // namespace genledger
