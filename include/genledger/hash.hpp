#pragma once

// genledger/hash.hpp — BLAKE3 digests.
//
// BLAKE3 is the sole hash primitive. Two domains are in use:
//   "jrn:"  journal chain links (digest of the previous NDJSON line)
//   "req:"  batch submission fingerprints stored with idempotency records
// Domain prefixes are part of the on-disk contract; changing one requires a
// HASH_ALGORITHM_VERSION bump.

#include <string>
#include <string_view>

namespace genledger {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
  bool blake3_available{false};
};

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
HashRuntimeInfo hash_runtime_info();

std::string journal_link_digest(std::string_view line);
std::string request_fingerprint(std::string_view canonical_request);

// Unique record identifier: "<prefix>_" + 20 hex chars. Mixes wall time,
// pid and a process-wide counter, so ids never repeat within a process and
// collide across processes only with negligible probability.
std::string make_record_id(std::string_view prefix);

}  // namespace genledger
