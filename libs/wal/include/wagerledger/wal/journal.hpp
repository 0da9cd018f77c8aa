#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <vector>

namespace wagerledger {
namespace wal {

// On-disk record header, host byte order. The checksum covers the payload.
struct RecordHeader {
  std::uint32_t magic{0x574c4a52};  // 'WLJR'
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// The file ends inside a record, as it does after a crash mid-append.
class TornRecord : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Append-only journal of applied ledger operations. Sequence numbers start
// at 1 and continue from the last record already in the file. A torn final
// record is cut off when the journal is opened; any other damage throws.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record.
  std::uint64_t append(std::span<const std::byte> payload);
  void flush();
  void sync();

  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] std::uint64_t last_sequence() const noexcept { return next_sequence_ - 1; }
  [[nodiscard]] std::uint64_t repaired_bytes() const noexcept { return repaired_bytes_; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> pending_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};
  std::uint64_t repaired_bytes_{0};

  void open(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  ~Reader();

  // Returns false at a clean end of file. Throws TornRecord if the file ends
  // inside a record and std::runtime_error if a record is corrupt.
  bool next(Record& out_record);

  // Positions the reader on the first record with sequence >= `sequence`.
  void seek_sequence(std::uint64_t sequence);

  // Offset just past the last intact record returned by next().
  [[nodiscard]] std::uint64_t intact_bytes() const noexcept { return intact_bytes_; }

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
  std::uint64_t intact_bytes_{0};
};

}  // namespace wal
}  // namespace wagerledger
