#pragma once
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace bufferfile::core {
  inline constexpr size_t HEADER_SIZE = 32;
  inline constexpr size_t BLOCK_PREFIX_SIZE = 5; // flags + block id

  struct FileHeader {
    int64_t magic_number = 0;
    int64_t file_id = 0;
    int32_t version = 1;
    int32_t block_size = 0;
    int32_t first_free_block = -1;
    int32_t param_count = 0;

    // Encodes the 32 header bytes in file order.
    std::vector<uint8_t> serialize() const;

    bool operator==(const FileHeader&) const = default;
  };

  // Decodes exactly HEADER_SIZE bytes, dispatching on the version field.
  // Throws TruncatedHeaderError or UnsupportedVersionError.
  FileHeader decode_header(std::span<const uint8_t> bytes);

  // Reads the header from offset 0 of `in`.
  FileHeader read_header(std::istream& in);

  bool is_supported_version(int32_t version);
}
