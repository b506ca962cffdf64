#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

namespace bufferfile::core {
  inline constexpr uint8_t FLAG_EMPTY = 0x01;
  inline constexpr int32_t END_OF_CHAIN = -1;

  struct BufferBlock {
    uint8_t flags = 0;
    // Caller-defined id when in use; next empty block index (or -1) when empty.
    int32_t block_id = 0;
    std::vector<uint8_t> payload;

    bool is_empty() const { return (flags & FLAG_EMPTY) != 0; }
  };

  // Physical offset of block `index`; the header occupies the block before index 0.
  // std::nullopt for a negative index or an offset past the largest seekable position.
  std::optional<uint64_t> block_offset(int64_t index, int32_t block_size);

  size_t payload_size(int32_t block_size);

  // std::nullopt when the block is not fully present in the file.
  // Throws InvalidBlockSizeError when block_size cannot hold the 5-byte prefix.
  std::optional<BufferBlock> try_read_block(std::istream& in, int32_t block_size, int64_t index);

  // As try_read_block, but a missing block throws BlockOutOfRangeError.
  BufferBlock read_block(std::istream& in, int32_t block_size, int64_t index);
}
