#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace wagerledger {
namespace common {
namespace codec {

template <typename T>
inline void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
inline T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

template <std::size_t N>
inline void append_array(std::vector<std::byte>& buffer, const std::array<std::uint8_t, N>& value) {
  for (const auto byte : value) {
    buffer.push_back(static_cast<std::byte>(byte));
  }
}

template <std::size_t N>
inline std::array<std::uint8_t, N> read_array(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + N > data.size()) {
    throw std::runtime_error("decode out of bounds");
  }
  std::array<std::uint8_t, N> value{};
  for (std::size_t i = 0; i < N; ++i) {
    value[i] = static_cast<std::uint8_t>(data[offset + i]);
  }
  offset += N;
  return value;
}

// FNV-1a, used to detect torn or corrupted records on disk.
inline std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  std::uint32_t hash = 2166136261u;
  for (const auto b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= 16777619u;
  }
  return hash;
}

}  // namespace codec
}  // namespace common
}  // namespace wagerledger
