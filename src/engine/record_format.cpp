#include "lru_cache/record_format.hpp"

#include "lru_cache/types.hpp"

#include <cstddef>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace lru_cache {
namespace {

std::uint32_t checksum32(const std::uint8_t *key, std::size_t key_len,
                         const std::uint8_t *value, std::size_t value_len,
                         const RecordHeader &h) {
  std::uint32_t sum = 2166136261u;
  auto mix = [&](std::uint8_t b) {
    sum ^= b;
    sum *= 16777619u;
  };
  auto *p = reinterpret_cast<const std::uint8_t *>(&h);
  for (std::size_t i = 0; i < sizeof(RecordHeader); ++i) {
    if (i >= offsetof(RecordHeader, checksum) &&
        i < offsetof(RecordHeader, checksum) + sizeof(h.checksum))
      continue;
    mix(p[i]);
  }
  for (std::size_t i = 0; i < key_len; ++i)
    mix(key[i]);
  for (std::size_t i = 0; i < value_len; ++i)
    mix(value[i]);
  return sum;
}

std::uint32_t checked_u32(std::size_t n, const char *what) {
  if (n > std::numeric_limits<std::uint32_t>::max())
    throw std::length_error(std::string(what) + " too large for record");
  return static_cast<std::uint32_t>(n);
}

void append_raw(std::vector<std::uint8_t> *out, const void *data,
                std::size_t size) {
  if (size == 0)
    return;
  auto *p = static_cast<const std::uint8_t *>(data);
  out->insert(out->end(), p, p + size);
}

} // namespace

std::size_t record_size(std::size_t key_len, std::size_t value_len) {
  return sizeof(RecordHeader) + key_len + value_len;
}

void append_file_header(std::vector<std::uint8_t> *out, std::uint64_t count) {
  FileHeader h{};
  h.magic = kFileMagic;
  h.version = kFormatVersion;
  h.count = count;
  append_raw(out, &h, sizeof(h));
}

void append_record(std::vector<std::uint8_t> *out,
                   const std::vector<std::uint8_t> &key,
                   const std::vector<std::uint8_t> &value) {
  RecordHeader h{};
  h.key_len = checked_u32(key.size(), "key");
  h.value_len = checked_u32(value.size(), "value");
  h.checksum = checksum32(key.data(), key.size(), value.data(), value.size(), h);
  append_raw(out, &h, sizeof(h));
  append_raw(out, key.data(), key.size());
  append_raw(out, value.data(), value.size());
}

std::vector<RawRecord> decode_records(const std::vector<std::uint8_t> &data) {
  if (data.size() < sizeof(FileHeader))
    throw DecodeError("file shorter than header");
  FileHeader fh{};
  std::memcpy(&fh, data.data(), sizeof(fh));
  if (fh.magic != kFileMagic)
    throw DecodeError("bad file magic");
  if (fh.version != kFormatVersion)
    throw DecodeError("unsupported format version " +
                      std::to_string(fh.version));

  std::vector<RawRecord> out;
  std::size_t off = sizeof(FileHeader);
  for (std::uint64_t i = 0; i < fh.count; ++i) {
    if (data.size() - off < sizeof(RecordHeader))
      throw DecodeError("truncated record header at offset " +
                        std::to_string(off));
    RecordHeader h{};
    std::memcpy(&h, data.data() + off, sizeof(h));
    off += sizeof(h);
    const std::size_t body = static_cast<std::size_t>(h.key_len) + h.value_len;
    if (data.size() - off < body)
      throw DecodeError("truncated record body at offset " +
                        std::to_string(off));
    const std::uint8_t *key = data.data() + off;
    const std::uint8_t *value = key + h.key_len;
    if (checksum32(key, h.key_len, value, h.value_len, h) != h.checksum)
      throw DecodeError("checksum mismatch in record " + std::to_string(i));
    RawRecord r;
    r.key.assign(key, key + h.key_len);
    r.value.assign(value, value + h.value_len);
    out.push_back(std::move(r));
    off += body;
  }
  if (off != data.size())
    throw DecodeError("trailing bytes after last record");
  return out;
}

} // namespace lru_cache
