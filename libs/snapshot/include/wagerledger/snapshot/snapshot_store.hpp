#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace wagerledger {
namespace snapshot {

struct SnapshotRecord {
  // Last journal sequence whose effect is contained in the payload.
  std::uint64_t sequence{0};
  std::vector<std::byte> payload{};
};

class Store {
 public:
  Store();
  explicit Store(std::filesystem::path directory);

  void prepare(const std::filesystem::path& directory);

  // Writes to a temporary file and renames it over the previous snapshot.
  void persist(std::uint64_t sequence, std::span<const std::byte> payload);
  // nullopt if nothing was persisted yet. Throws if the file is damaged.
  [[nodiscard]] std::optional<SnapshotRecord> latest() const;
  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

 private:
  std::filesystem::path directory_{};
  std::filesystem::path file_path_{};
};

}  // namespace snapshot
}  // namespace wagerledger
