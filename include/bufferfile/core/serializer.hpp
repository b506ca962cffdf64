#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>
#include <type_traits>

namespace bufferfile::core {

  struct SerializeError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // All multi-byte integers are big-endian two's complement.
  class ByteWriter {
    public:
      void write_u8(uint8_t value) { buffer_.push_back(value); }
      void write_i32(int32_t value) { write_be_value(static_cast<uint32_t>(value)); }
      void write_i64(int64_t value) { write_be_value(static_cast<uint64_t>(value)); }

      void write_raw(std::span<const uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
      }

      void write_string(std::string_view str) {
        write_i32(static_cast<int32_t>(str.size()));
        buffer_.insert(buffer_.end(), str.begin(), str.end());
      }

      const std::vector<uint8_t>& buffer() const { return buffer_; }
      std::vector<uint8_t> take() { return std::move(buffer_); }

    private:
      template <class T> void write_be_value(T value) {
        for (size_t i = sizeof(T); i > 0; --i) buffer_.push_back(static_cast<uint8_t>((value >> (8*(i-1))) & 0xFF));
      }
      std::vector<uint8_t> buffer_;
   };

   class ByteReader {
    public:
      explicit ByteReader(std::span<const uint8_t> src) : src_(src) {}

      uint8_t read_u8() { return read_value<uint8_t>(); }
      int32_t read_i32() { return static_cast<int32_t>(read_value<uint32_t>()); }
      int64_t read_i64() { return static_cast<int64_t>(read_value<uint64_t>()); }

      std::vector<uint8_t> read_raw(size_t len) {
        ensure(len <= remaining_bytes());
        std::vector<uint8_t> result(src_.begin() + pos_, src_.begin() + pos_ + len);
        pos_ += len;
        return result;
      }

      size_t remaining_bytes() const { return src_.size() - pos_; }
      size_t position() const { return pos_; }

    private:
      template <class T> T read_value() {
        static_assert(std::is_integral_v<T> && std::is_unsigned_v<T>, "T must be unsigned integral");
        ensure(remaining_bytes() >= sizeof(T));
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
          value = static_cast<T>((value << 8) | static_cast<T>(src_[pos_++]));
        }
        return value;
      }
      void ensure(bool condition) { if (!condition) throw SerializeError("deserialize: truncated/invalid buffer");}

      std::span<const uint8_t> src_;
      size_t pos_ = 0;
   };
}
