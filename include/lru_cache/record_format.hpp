#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lru_cache {

// On-disk layout: one FileHeader followed by `count` records, each a
// RecordHeader plus key bytes plus value bytes. Host byte order for the
// headers; the file is only read back by this library.
#pragma pack(push, 1)
struct FileHeader {
  std::uint32_t magic;
  std::uint32_t version;
  std::uint64_t count;
};

struct RecordHeader {
  std::uint32_t checksum;
  std::uint32_t key_len;
  std::uint32_t value_len;
};
#pragma pack(pop)

constexpr std::uint32_t kFileMagic = 0x4c525543; // LRUC
constexpr std::uint32_t kFormatVersion = 1;
constexpr std::size_t kFileHeaderSize = sizeof(FileHeader);

struct RawRecord {
  std::vector<std::uint8_t> key;
  std::vector<std::uint8_t> value;
};

std::size_t record_size(std::size_t key_len, std::size_t value_len);

void append_file_header(std::vector<std::uint8_t> *out, std::uint64_t count);
void append_record(std::vector<std::uint8_t> *out,
                   const std::vector<std::uint8_t> &key,
                   const std::vector<std::uint8_t> &value);

// Throws DecodeError on bad magic or version, truncation, checksum mismatch
// or trailing bytes.
std::vector<RawRecord> decode_records(const std::vector<std::uint8_t> &data);

} // namespace lru_cache
