#include "identity/digest.hpp"

#include <array>
#include <utility>

extern "C" {
#include "blake3.h"
}

namespace sid::identity {
namespace {

template <std::size_t N>
auto blake3_finalize(std::string_view payload) -> std::array<std::uint8_t, N> {
  std::array<std::uint8_t, N> out{};
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

}  // namespace

auto blake3_128(std::string_view payload) -> Digest128 {
  Digest128 digest{};
  digest.bytes = blake3_finalize<16>(payload);
  return digest;
}

auto to_hex(std::span<const std::uint8_t> bytes) -> std::string {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

auto blake3_128_hex(std::string_view payload) -> std::string {
  auto digest = blake3_128(payload);
  return to_hex(digest.bytes);
}

auto blake3_256_hex(std::string_view payload) -> std::string {
  auto bytes = blake3_finalize<BLAKE3_OUT_LEN>(payload);
  return to_hex(bytes);
}

auto default_hash_function() -> HashFunction {
  return &blake3_128_hex;
}

auto find_hash_function(std::string_view name) -> std::optional<HashFunction> {
  if (name == "blake3_128") {
    return HashFunction(&blake3_128_hex);
  }
  if (name == "blake3_256") {
    return HashFunction(&blake3_256_hex);
  }
  return std::nullopt;
}

auto truncate_hash(std::string digest, std::size_t limit) -> std::string {
  if (limit < digest.size()) {
    digest.resize(limit);
  }
  return digest;
}

auto compute_identity_hash(std::string_view bytes, const HashFunction& hash_fn,
                           std::size_t limit) -> std::string {
  auto digest = hash_fn ? hash_fn(bytes) : blake3_128_hex(bytes);
  return truncate_hash(std::move(digest), limit);
}

}  // namespace sid::identity
