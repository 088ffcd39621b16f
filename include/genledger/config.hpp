#pragma once

// genledger/config.hpp — Runtime configuration.
//
// Sources, lowest precedence first:
//   1. Compiled defaults (Config member initializers).
//   2. JSON config file (load_config_file), keys identical to member names.
//   3. GENLEDGER_* environment variables (apply_env_overrides), e.g.
//      GENLEDGER_GLOBAL_CONCURRENCY=4, GENLEDGER_JOURNAL_PATH=/var/lib/gl.ndjson
//
// INVARIANT: a Config that passed validate_config() has non-zero caps,
// windows and intervals. Components may rely on that and never divide by or
// loop on a zero interval.

#include <cstdint>
#include <string>

namespace genledger {

struct Config {
  // Concurrency gates
  uint32_t global_concurrency{10};
  uint32_t per_owner_concurrency{10};

  // Admission
  uint32_t rate_limit_per_window{10};
  uint64_t rate_window_ms{60000};
  uint64_t idempotency_window_ms{60000};
  uint32_t max_prompt_chars{3000};
  uint32_t max_tasks_per_batch{50};

  // Execution
  uint64_t tick_interval_ms{100};
  uint64_t poll_interval_ms{3000};
  uint64_t max_poll_ms{900000};
  uint32_t error_summary_max{500};

  // Reconciliation
  uint64_t stale_running_ms{1800000};
  uint64_t sweep_interval_ms{30000};

  // Collaborators
  std::string journal_path;        // empty = in-memory only
  std::string price_table_path;    // empty = built-in prices
  std::string provider_command;    // executable driven by ProcessJobClient
  uint64_t    provider_timeout_ms{30000};
};

struct ConfigResult {
  bool        ok{false};
  Config      config;
  std::string error_code;     // config_parse_error | config_unknown_key | config_invalid | config_unreadable
  std::string error_message;
};

// Returns "" when valid, else a description of the first bad field.
std::string validate_config(const Config& c);

// Parse JSON text on top of `base`.
ConfigResult parse_config_json(const std::string& text, const Config& base = Config{});
ConfigResult load_config_file(const std::string& path, const Config& base = Config{});

// Apply GENLEDGER_* overrides. Unparseable values keep the current value and
// log a warning.
Config apply_env_overrides(Config c);

// Defaults → GENLEDGER_CONFIG file (if set) → env overrides → validate.
ConfigResult load_config_from_env();

std::string config_to_json(const Config& c);

}  // namespace genledger
