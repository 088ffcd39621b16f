#include "genledger/config.hpp"

#include "genledger/jsonlite.hpp"
#include "genledger/observability.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <variant>

namespace genledger {

namespace {

// One row per configurable member: JSON key, env var, member pointer.
using MemberPtr = std::variant<uint32_t Config::*, uint64_t Config::*, std::string Config::*>;

struct FieldSpec {
  const char* key;
  const char* env;
  MemberPtr   member;
};

const FieldSpec kFields[] = {
    {"global_concurrency",    "GENLEDGER_GLOBAL_CONCURRENCY",    &Config::global_concurrency},
    {"per_owner_concurrency", "GENLEDGER_PER_OWNER_CONCURRENCY", &Config::per_owner_concurrency},
    {"rate_limit_per_window", "GENLEDGER_RATE_LIMIT",            &Config::rate_limit_per_window},
    {"rate_window_ms",        "GENLEDGER_RATE_WINDOW_MS",        &Config::rate_window_ms},
    {"idempotency_window_ms", "GENLEDGER_IDEMPOTENCY_WINDOW_MS", &Config::idempotency_window_ms},
    {"max_prompt_chars",      "GENLEDGER_MAX_PROMPT_CHARS",      &Config::max_prompt_chars},
    {"max_tasks_per_batch",   "GENLEDGER_MAX_TASKS_PER_BATCH",   &Config::max_tasks_per_batch},
    {"tick_interval_ms",      "GENLEDGER_TICK_INTERVAL_MS",      &Config::tick_interval_ms},
    {"poll_interval_ms",      "GENLEDGER_POLL_INTERVAL_MS",      &Config::poll_interval_ms},
    {"max_poll_ms",           "GENLEDGER_MAX_POLL_MS",           &Config::max_poll_ms},
    {"error_summary_max",     "GENLEDGER_ERROR_SUMMARY_MAX",     &Config::error_summary_max},
    {"stale_running_ms",      "GENLEDGER_STALE_RUNNING_MS",      &Config::stale_running_ms},
    {"sweep_interval_ms",     "GENLEDGER_SWEEP_INTERVAL_MS",     &Config::sweep_interval_ms},
    {"journal_path",          "GENLEDGER_JOURNAL_PATH",          &Config::journal_path},
    {"price_table_path",      "GENLEDGER_PRICE_TABLE",           &Config::price_table_path},
    {"provider_command",      "GENLEDGER_PROVIDER_COMMAND",      &Config::provider_command},
    {"provider_timeout_ms",   "GENLEDGER_PROVIDER_TIMEOUT_MS",   &Config::provider_timeout_ms},
};

bool parse_unsigned(const std::string& s, uint64_t max, uint64_t& out) {
  if (s.empty()) return false;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    const uint64_t d = static_cast<uint64_t>(c - '0');
    if (v > (max - d) / 10) return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

ConfigResult fail(const std::string& code, const std::string& message) {
  ConfigResult r;
  r.ok = false;
  r.error_code = code;
  r.error_message = message;
  return r;
}

}  // namespace

std::string validate_config(const Config& c) {
  if (c.global_concurrency == 0) return "global_concurrency must be > 0";
  if (c.per_owner_concurrency == 0) return "per_owner_concurrency must be > 0";
  if (c.rate_limit_per_window == 0) return "rate_limit_per_window must be > 0";
  if (c.rate_window_ms == 0) return "rate_window_ms must be > 0";
  if (c.max_prompt_chars == 0) return "max_prompt_chars must be > 0";
  if (c.max_tasks_per_batch == 0) return "max_tasks_per_batch must be > 0";
  if (c.tick_interval_ms == 0) return "tick_interval_ms must be > 0";
  if (c.poll_interval_ms == 0) return "poll_interval_ms must be > 0";
  if (c.max_poll_ms < c.poll_interval_ms) return "max_poll_ms must be >= poll_interval_ms";
  if (c.error_summary_max == 0) return "error_summary_max must be > 0";
  if (c.stale_running_ms == 0) return "stale_running_ms must be > 0";
  if (c.sweep_interval_ms == 0) return "sweep_interval_ms must be > 0";
  if (c.provider_timeout_ms == 0) return "provider_timeout_ms must be > 0";
  return "";
}

ConfigResult parse_config_json(const std::string& text, const Config& base) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(text, &err);
  if (err) return fail("config_parse_error", err->code + ": " + err->message);

  Config c = base;
  for (const auto& [key, value] : obj) {
    const FieldSpec* spec = nullptr;
    for (const auto& f : kFields) {
      if (key == f.key) { spec = &f; break; }
    }
    if (!spec) return fail("config_unknown_key", "unknown config key: " + key);

    if (auto* p = std::get_if<std::string Config::*>(&spec->member)) {
      if (!std::holds_alternative<std::string>(value.v)) {
        return fail("config_invalid", key + " must be a string");
      }
      c.*(*p) = std::get<std::string>(value.v);
      continue;
    }
    if (!std::holds_alternative<std::uint64_t>(value.v)) {
      return fail("config_invalid", key + " must be a non-negative integer");
    }
    const uint64_t n = std::get<std::uint64_t>(value.v);
    if (auto* p32 = std::get_if<uint32_t Config::*>(&spec->member)) {
      if (n > std::numeric_limits<uint32_t>::max()) return fail("config_invalid", key + " out of range");
      c.*(*p32) = static_cast<uint32_t>(n);
    } else {
      c.*(std::get<uint64_t Config::*>(spec->member)) = n;
    }
  }

  const std::string problem = validate_config(c);
  if (!problem.empty()) return fail("config_invalid", problem);

  ConfigResult r;
  r.ok = true;
  r.config = c;
  return r;
}

ConfigResult load_config_file(const std::string& path, const Config& base) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return fail("config_unreadable", "cannot open " + path);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return parse_config_json(ss.str(), base);
}

Config apply_env_overrides(Config c) {
  for (const auto& f : kFields) {
    const char* e = std::getenv(f.env);
    if (!e || !e[0]) continue;
    const std::string raw(e);

    if (auto* p = std::get_if<std::string Config::*>(&f.member)) {
      c.*(*p) = raw;
      continue;
    }
    uint64_t n = 0;
    if (auto* p32 = std::get_if<uint32_t Config::*>(&f.member)) {
      if (!parse_unsigned(raw, std::numeric_limits<uint32_t>::max(), n)) {
        log(LogLevel::warn, "config", std::string(f.env) + "=" + raw + " ignored: not a uint32");
        continue;
      }
      c.*(*p32) = static_cast<uint32_t>(n);
    } else {
      if (!parse_unsigned(raw, std::numeric_limits<uint64_t>::max(), n)) {
        log(LogLevel::warn, "config", std::string(f.env) + "=" + raw + " ignored: not a uint64");
        continue;
      }
      c.*(std::get<uint64_t Config::*>(f.member)) = n;
    }
  }
  return c;
}

ConfigResult load_config_from_env() {
  Config c;
  const char* file = std::getenv("GENLEDGER_CONFIG");
  if (file && file[0]) {
    auto r = load_config_file(file, c);
    if (!r.ok) return r;
    c = r.config;
  }
  c = apply_env_overrides(c);
  const std::string problem = validate_config(c);
  if (!problem.empty()) return fail("config_invalid", problem);
  ConfigResult r;
  r.ok = true;
  r.config = c;
  return r;
}

std::string config_to_json(const Config& c) {
  std::ostringstream o;
  o << "{";
  bool first = true;
  for (const auto& f : kFields) {
    if (!first) o << ",";
    first = false;
    o << "\"" << f.key << "\":";
    if (auto* p = std::get_if<std::string Config::*>(&f.member)) {
      o << "\"" << jsonlite::escape(c.*(*p)) << "\"";
    } else if (auto* p32 = std::get_if<uint32_t Config::*>(&f.member)) {
      o << c.*(*p32);
    } else {
      o << c.*(std::get<uint64_t Config::*>(f.member));
    }
  }
  o << "}";
  return o.str();
}

}  // namespace genledger
