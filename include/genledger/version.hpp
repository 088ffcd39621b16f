#pragma once

// genledger/version.hpp — Version manifest for every persisted or wire format.
//
// INVARIANT:
//   Never silently accept data written by a newer format version than this
//   build was compiled against. The journal reader checks JOURNAL_FORMAT_VERSION
//   on every line; the serve loop stamps PROTOCOL_FRAMING_VERSION on responses.

#include <cstdint>
#include <string>

namespace genledger {
namespace version {

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3-256, hex-encoded, "jrn:"/"req:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// JOURNAL_FORMAT_VERSION
// Version 1 = NDJSON, one operation per line, {v, seq, prev, op, ...}.
// Adding a required field or a new op type requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t JOURNAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// PROTOCOL_FRAMING_VERSION
// NDJSON request/response frames of `genledger_cli serve`.
// Version 1 = {"op":...} requests, {"ok":bool,"v":1,...} responses.
// ---------------------------------------------------------------------------
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

struct VersionManifest {
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t journal_format{JOURNAL_FORMAT_VERSION};
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace genledger
