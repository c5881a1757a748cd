#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sid::identity {

/// Pluggable one-way function from the hash input bytes to a printable digest.
using HashFunction = std::function<std::string(std::string_view)>;

/// `hash_limit_length` value that keeps the full digest.
inline constexpr std::size_t kUnboundedLength = std::numeric_limits<std::size_t>::max();

/// 128-bit digest of the hash input envelope.
struct Digest128 {
  std::array<std::uint8_t, 16> bytes{};
};

/// Hash the payload with BLAKE3, finalized to 128 bits.
auto blake3_128(std::string_view payload) -> Digest128;

/// Lowercase hexadecimal rendering.
auto to_hex(std::span<const std::uint8_t> bytes) -> std::string;

/// Default hash function: BLAKE3-128 as 32 lowercase hex characters.
auto blake3_128_hex(std::string_view payload) -> std::string;

/// Full-width BLAKE3 (256 bits) as 64 lowercase hex characters.
auto blake3_256_hex(std::string_view payload) -> std::string;

auto default_hash_function() -> HashFunction;

/// Look up a built-in hash function by name ("blake3_128", "blake3_256").
auto find_hash_function(std::string_view name) -> std::optional<HashFunction>;

/// Keep the first `limit` characters; a limit past the end keeps everything.
auto truncate_hash(std::string digest, std::size_t limit) -> std::string;

/// Apply `hash_fn` (default when empty) to the bytes and truncate.
auto compute_identity_hash(std::string_view bytes, const HashFunction& hash_fn,
                           std::size_t limit) -> std::string;

}  // namespace sid::identity
