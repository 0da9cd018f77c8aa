#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace wagerledger {
namespace common {

constexpr std::size_t kIdentitySize = 32;

using Amount = std::uint64_t;
using Seed = std::uint8_t;

// ed25519 public key, or a key derived from the game seed
using Identity = std::array<std::uint8_t, kIdentitySize>;

// Caller-supplied token that makes a retried request a no-op
using IdempotencyKey = std::array<std::uint8_t, 16>;

[[nodiscard]] inline constexpr std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept {
  if (rhs > std::numeric_limits<Amount>::max() - lhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

[[nodiscard]] inline constexpr std::optional<Amount> checked_sub(Amount lhs, Amount rhs) noexcept {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

std::string to_hex(const Identity& identity);
std::string to_hex(const IdempotencyKey& key);
std::optional<Identity> identity_from_hex(std::string_view hex);
std::optional<IdempotencyKey> idempotency_key_from_hex(std::string_view hex);

struct IdentityHash {
  std::size_t operator()(const Identity& identity) const noexcept {
    // ed25519 keys and BLAKE2b digests are already uniformly distributed
    std::size_t value = 0;
    for (std::size_t i = 0; i < sizeof(std::size_t) && i < identity.size(); ++i) {
      value = (value << 8) | identity[i];
    }
    return value;
  }
};

struct IdempotencyKeyHash {
  std::size_t operator()(const IdempotencyKey& key) const noexcept {
    std::size_t value = 0;
    for (const auto byte : key) {
      value = value * 131 + byte;
    }
    return value;
  }
};

}  // namespace common
}  // namespace wagerledger
