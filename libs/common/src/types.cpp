#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace common {

namespace {

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> bytes_from_hex(std::string_view hex) {
  if (hex.size() != N * 2) {
    return std::nullopt;
  }
  std::array<std::uint8_t, N> out{};
  for (std::size_t i = 0; i < N; ++i) {
    const int hi = hex_value(hex[2 * i]);
    const int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return out;
}

template <std::size_t N>
std::string hex_of(const std::array<std::uint8_t, N>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (const auto byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0f]);
  }
  return out;
}

}  // namespace

std::string to_hex(const Identity& identity) {
  return hex_of(identity);
}

std::string to_hex(const IdempotencyKey& key) {
  return hex_of(key);
}

std::optional<Identity> identity_from_hex(std::string_view hex) {
  return bytes_from_hex<kIdentitySize>(hex);
}

std::optional<IdempotencyKey> idempotency_key_from_hex(std::string_view hex) {
  return bytes_from_hex<std::tuple_size_v<IdempotencyKey>>(hex);
}

}  // namespace common
}  // namespace wagerledger
