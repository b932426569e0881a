#pragma once

#include "lru_cache/types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace lru_cache {

std::uint64_t fnv1a(const std::uint8_t *data, std::size_t size);

class ByteWriter {
public:
  void put_u8(std::uint8_t v) { buf_.push_back(v); }
  void put_u32(std::uint32_t v) { put_uint(v, sizeof(v)); }
  // Little-endian, `width` low-order bytes of `v`.
  void put_uint(std::uint64_t v, std::size_t width);
  // u32 element count; throws std::length_error above 4 GiB elements.
  void put_length(std::size_t n);
  void put_bytes(const void *data, std::size_t size);

  const std::vector<std::uint8_t> &bytes() const { return buf_; }
  std::vector<std::uint8_t> take() { return std::move(buf_); }
  std::size_t size() const { return buf_.size(); }

private:
  std::vector<std::uint8_t> buf_;
};

// Every read past the end throws DecodeError.
class ByteReader {
public:
  ByteReader(const std::uint8_t *data, std::size_t size)
      : data_(data), size_(size) {}

  std::uint8_t get_u8();
  std::uint32_t get_u32() { return static_cast<std::uint32_t>(get_uint(4)); }
  std::uint64_t get_uint(std::size_t width);
  std::size_t get_length() { return get_u32(); }
  void get_bytes(void *out, std::size_t size);

  std::size_t remaining() const { return size_ - pos_; }
  bool empty() const { return pos_ == size_; }

private:
  void require(std::size_t n) const;

  const std::uint8_t *data_;
  std::size_t size_;
  std::size_t pos_{0};
};

// Specialize for a type to make it storable as a cache key or value.
template <typename T, typename = void> struct Codec;

template <typename T>
struct Codec<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
  static void encode(ByteWriter &out, const T &v) {
    if constexpr (std::is_same_v<T, bool>) {
      out.put_u8(v ? 1 : 0);
    } else if constexpr (std::is_floating_point_v<T>) {
      using Bits = std::conditional_t<sizeof(T) == 4, std::uint32_t,
                                      std::uint64_t>;
      static_assert(sizeof(T) == sizeof(Bits),
                    "unsupported floating point width");
      Bits bits;
      std::memcpy(&bits, &v, sizeof(bits));
      out.put_uint(bits, sizeof(bits));
    } else {
      out.put_uint(static_cast<std::make_unsigned_t<T>>(v), sizeof(T));
    }
  }

  static T decode(ByteReader &in) {
    if constexpr (std::is_same_v<T, bool>) {
      const auto b = in.get_u8();
      if (b > 1)
        throw DecodeError("invalid bool byte");
      return b == 1;
    } else if constexpr (std::is_floating_point_v<T>) {
      using Bits = std::conditional_t<sizeof(T) == 4, std::uint32_t,
                                      std::uint64_t>;
      const auto bits = static_cast<Bits>(in.get_uint(sizeof(Bits)));
      T v;
      std::memcpy(&v, &bits, sizeof(v));
      return v;
    } else {
      return static_cast<T>(
          static_cast<std::make_unsigned_t<T>>(in.get_uint(sizeof(T))));
    }
  }
};

template <> struct Codec<std::string> {
  static void encode(ByteWriter &out, const std::string &s) {
    out.put_length(s.size());
    out.put_bytes(s.data(), s.size());
  }
  static std::string decode(ByteReader &in) {
    const auto n = in.get_length();
    if (n > in.remaining())
      throw DecodeError("string length exceeds input");
    std::string s(n, '\0');
    in.get_bytes(s.data(), n);
    return s;
  }
};

template <typename T> struct Codec<std::vector<T>> {
  static void encode(ByteWriter &out, const std::vector<T> &v) {
    out.put_length(v.size());
    if constexpr (std::is_same_v<T, std::uint8_t>) {
      out.put_bytes(v.data(), v.size());
    } else {
      for (const auto &e : v)
        Codec<T>::encode(out, e);
    }
  }
  static std::vector<T> decode(ByteReader &in) {
    const auto n = in.get_length();
    std::vector<T> v;
    if constexpr (std::is_same_v<T, std::uint8_t>) {
      if (n > in.remaining())
        throw DecodeError("byte vector length exceeds input");
      v.resize(n);
      in.get_bytes(v.data(), n);
    } else {
      v.reserve(std::min(n, in.remaining()));
      for (std::size_t i = 0; i < n; ++i)
        v.push_back(Codec<T>::decode(in));
    }
    return v;
  }
};

template <typename A, typename B> struct Codec<std::pair<A, B>> {
  static void encode(ByteWriter &out, const std::pair<A, B> &p) {
    Codec<A>::encode(out, p.first);
    Codec<B>::encode(out, p.second);
  }
  static std::pair<A, B> decode(ByteReader &in) {
    A first = Codec<A>::decode(in);
    B second = Codec<B>::decode(in);
    return {std::move(first), std::move(second)};
  }
};

template <typename... Ts> struct Codec<std::tuple<Ts...>> {
  static void encode(ByteWriter &out, const std::tuple<Ts...> &t) {
    std::apply([&out](const Ts &...e) { (Codec<Ts>::encode(out, e), ...); },
               t);
  }
  static std::tuple<Ts...> decode(ByteReader &in) {
    // Braced initialization evaluates left to right.
    return std::tuple<Ts...>{Codec<Ts>::decode(in)...};
  }
};

template <typename T> std::vector<std::uint8_t> encode_value(const T &v) {
  ByteWriter w;
  Codec<T>::encode(w, v);
  return w.take();
}

// The whole input must be consumed.
template <typename T> T decode_value(const std::uint8_t *data, std::size_t size) {
  ByteReader r(data, size);
  T v = Codec<T>::decode(r);
  if (!r.empty())
    throw DecodeError("trailing bytes after value");
  return v;
}

template <typename T, typename = void> struct KeyHash {
  std::size_t operator()(const T &key) const {
    const auto bytes = encode_value(key);
    return static_cast<std::size_t>(fnv1a(bytes.data(), bytes.size()));
  }
};

template <typename T>
struct KeyHash<T, std::enable_if_t<std::is_default_constructible_v<std::hash<T>>>>
    : std::hash<T> {};

std::string hex_digest(std::uint64_t h);

// Printable form of a key for log events. Strings with bytes outside
// printable ASCII are shown as a digest.
template <typename T> std::string describe_key(const T &key) {
  if constexpr (std::is_convertible_v<const T &, std::string_view>) {
    const std::string_view text(key);
    const bool printable =
        std::all_of(text.begin(), text.end(), [](char ch) {
          return ch >= 0x20 && ch < 0x7f;
        });
    if (printable)
      return std::string(text);
    return hex_digest(fnv1a(reinterpret_cast<const std::uint8_t *>(text.data()),
                            text.size()));
  } else if constexpr (std::is_same_v<T, bool>) {
    return key ? "true" : "false";
  } else if constexpr (std::is_arithmetic_v<T>) {
    return std::to_string(key);
  } else {
    const auto bytes = encode_value(key);
    return hex_digest(fnv1a(bytes.data(), bytes.size()));
  }
}

} // namespace lru_cache
