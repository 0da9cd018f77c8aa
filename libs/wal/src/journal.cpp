#include "wagerledger/wal/journal.hpp"

#include <cerrno>
#include <string>
#include <system_error>

#include "wagerledger/common/byte_codec.hpp"
#include "wagerledger/common/file_sync.hpp"

namespace wagerledger {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x574c4a52;  // 'WLJR'
constexpr std::uint16_t kVersion = 1;

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : flush_threshold_(flush_threshold_bytes) {
  pending_.reserve(flush_threshold_bytes);
  open(path);
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception&) {
    // Records still buffered here are lost.
  }
  if (file_) {
    std::fclose(file_);
  }
}

void Writer::open(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  if (std::filesystem::exists(path)) {
    std::uint64_t intact = 0;
    bool torn = false;
    {
      Reader reader(path);
      Record record;
      try {
        while (reader.next(record)) {
          next_sequence_ = record.header.sequence + 1;
        }
      } catch (const TornRecord&) {
        torn = true;
      }
      intact = reader.intact_bytes();
    }
    if (torn) {
      repaired_bytes_ = std::filesystem::file_size(path) - intact;
      std::filesystem::resize_file(path, intact);
    }
  }

  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open journal file: " + path.string());
  }
}

std::uint64_t Writer::append(std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("journal writer not open");
  }

  RecordHeader header;
  header.magic = kMagic;
  header.version = kVersion;
  header.sequence = next_sequence_;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = common::codec::checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  pending_.insert(pending_.end(), header_bytes.begin(), header_bytes.end());
  pending_.insert(pending_.end(), payload.begin(), payload.end());
  ++next_sequence_;

  if (pending_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || pending_.empty()) {
    return;
  }
  if (std::fwrite(pending_.data(), 1, pending_.size(), file_) != pending_.size()) {
    throw std::runtime_error("failed to write journal records");
  }
  pending_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (file_) {
    common::fsync_file(file_);
  }
}

Reader::Reader(const std::filesystem::path& path) : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open journal for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
  }
}

bool Reader::next(Record& out_record) {
  RecordHeader header;
  const auto header_read = std::fread(&header, 1, sizeof(header), file_);
  if (header_read == 0) {
    return false;
  }
  if (header_read != sizeof(header)) {
    throw TornRecord("torn journal header in " + path_.string());
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid journal magic in " + path_.string());
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported journal version in " + path_.string());
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0 &&
      std::fread(out_record.payload.data(), 1, header.payload_size, file_) != header.payload_size) {
    throw TornRecord("torn journal record at sequence " + std::to_string(header.sequence));
  }
  if (header.checksum != common::codec::checksum32(out_record.payload)) {
    throw std::runtime_error("journal checksum mismatch at sequence " + std::to_string(header.sequence));
  }

  intact_bytes_ += sizeof(header) + header.payload_size;
  return true;
}

void Reader::seek_sequence(std::uint64_t sequence) {
  std::rewind(file_);
  intact_bytes_ = 0;

  Record record;
  while (true) {
    const auto before = intact_bytes_;
    if (!next(record)) {
      return;
    }
    if (record.header.sequence >= sequence) {
      if (std::fseek(file_, static_cast<long>(before), SEEK_SET) != 0) {
        throw std::runtime_error("failed to seek in journal");
      }
      intact_bytes_ = before;
      return;
    }
  }
}

}  // namespace wal
}  // namespace wagerledger
