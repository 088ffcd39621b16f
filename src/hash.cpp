#include "genledger/hash.hpp"

// DESIGN INVARIANTS:
//   1. Every digest is BLAKE3-256, lower-case hex (64 chars).
//   2. Domain separation is by prefix: hash_domain(d, p) = BLAKE3(d || p).

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <unistd.h>

extern "C" {
#include <blake3.h>
}

namespace genledger {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::atomic<uint64_t> g_id_counter{0};

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string journal_link_digest(std::string_view line) {
  return hash_domain("jrn:", line);
}

std::string request_fingerprint(std::string_view canonical_request) {
  return hash_domain("req:", canonical_request);
}

std::string make_record_id(std::string_view prefix) {
  using SC = std::chrono::system_clock;
  const auto now_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(SC::now().time_since_epoch()).count());
  const uint64_t seq = g_id_counter.fetch_add(1, std::memory_order_relaxed);
  const std::string seed = std::to_string(now_ns) + ":" +
                           std::to_string(static_cast<long>(::getpid())) + ":" +
                           std::to_string(seq);
  std::string out(prefix);
  out += "_";
  out += hash_domain("id:", seed).substr(0, 20);
  return out;
}

}  // namespace genledger
