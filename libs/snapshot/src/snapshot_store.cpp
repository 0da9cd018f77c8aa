#include "wagerledger/snapshot/snapshot_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "wagerledger/common/byte_codec.hpp"
#include "wagerledger/common/file_sync.hpp"

namespace wagerledger {
namespace snapshot {

namespace {
constexpr std::uint32_t kMagic = 0x574c534e;  // 'WLSN'
constexpr std::uint16_t kVersion = 1;

struct SnapshotHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kVersion};
  std::uint16_t reserved{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
  std::uint64_t sequence{0};
};

}  // namespace

Store::Store() = default;

Store::Store(std::filesystem::path directory) {
  prepare(directory);
}

void Store::prepare(const std::filesystem::path& directory) {
  if (!std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
  }
  directory_ = directory;
  file_path_ = directory_ / "ledger.snap";
}

void Store::persist(std::uint64_t sequence, std::span<const std::byte> payload) {
  if (directory_.empty()) {
    throw std::runtime_error("snapshot store directory not set");
  }

  auto tmp_path = file_path_;
  tmp_path += ".tmp";

  std::FILE* out = std::fopen(tmp_path.c_str(), "wb");
  if (!out) {
    throw std::runtime_error("failed to open snapshot file for write: " + tmp_path.string());
  }
  try {
    SnapshotHeader header;
    header.sequence = sequence;
    header.payload_size = static_cast<std::uint32_t>(payload.size());
    header.checksum = common::codec::checksum32(payload);

    if (std::fwrite(&header, 1, sizeof(header), out) != sizeof(header)) {
      throw std::runtime_error("failed to write snapshot header");
    }
    if (!payload.empty() && std::fwrite(payload.data(), 1, payload.size(), out) != payload.size()) {
      throw std::runtime_error("failed to write snapshot payload");
    }
    if (std::fflush(out) != 0) {
      throw std::runtime_error("failed to flush snapshot file");
    }
    // Durable before the rename publishes it.
    common::fsync_file(out);
  } catch (...) {
    std::fclose(out);
    throw;
  }
  if (std::fclose(out) != 0) {
    throw std::runtime_error("failed to close snapshot file");
  }
  std::filesystem::rename(tmp_path, file_path_);
}

std::optional<SnapshotRecord> Store::latest() const {
  if (file_path_.empty() || !std::filesystem::exists(file_path_)) {
    return std::nullopt;
  }

  std::ifstream in(file_path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open snapshot file for read: " + file_path_.string());
  }

  SnapshotHeader header;
  if (!in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
    throw std::runtime_error("truncated snapshot header");
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid snapshot magic");
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported snapshot version");
  }

  SnapshotRecord record;
  record.sequence = header.sequence;
  record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    in.read(reinterpret_cast<char*>(record.payload.data()), static_cast<std::streamsize>(header.payload_size));
    if (!in) {
      throw std::runtime_error("truncated snapshot record");
    }
  }
  if (header.checksum != common::codec::checksum32(record.payload)) {
    throw std::runtime_error("snapshot checksum mismatch in " + file_path_.string());
  }
  return record;
}

}  // namespace snapshot
}  // namespace wagerledger
