#include "lru_cache/codec.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace lru_cache {

std::uint64_t fnv1a(const std::uint8_t *data, std::size_t size) {
  std::uint64_t hash = 14695981039346656037ull;
  for (std::size_t i = 0; i < size; ++i) {
    hash ^= data[i];
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string hex_digest(std::uint64_t h) {
  std::ostringstream os;
  os << '#' << std::hex << std::setw(16) << std::setfill('0') << h;
  return os.str();
}

void ByteWriter::put_uint(std::uint64_t v, std::size_t width) {
  for (std::size_t i = 0; i < width; ++i)
    buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
}

void ByteWriter::put_length(std::size_t n) {
  if (n > std::numeric_limits<std::uint32_t>::max())
    throw std::length_error("sequence too long to encode");
  put_u32(static_cast<std::uint32_t>(n));
}

void ByteWriter::put_bytes(const void *data, std::size_t size) {
  if (size == 0)
    return;
  auto *p = static_cast<const std::uint8_t *>(data);
  buf_.insert(buf_.end(), p, p + size);
}

std::uint8_t ByteReader::get_u8() {
  require(1);
  return data_[pos_++];
}

std::uint64_t ByteReader::get_uint(std::size_t width) {
  require(width);
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < width; ++i)
    v |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
  pos_ += width;
  return v;
}

void ByteReader::get_bytes(void *out, std::size_t size) {
  require(size);
  if (size == 0)
    return;
  std::memcpy(out, data_ + pos_, size);
  pos_ += size;
}

void ByteReader::require(std::size_t n) const {
  if (n > size_ - pos_)
    throw DecodeError("unexpected end of input");
}

} // namespace lru_cache
