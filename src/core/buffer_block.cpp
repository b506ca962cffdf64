#include "bufferfile/core/buffer_block.hpp"
#include "bufferfile/core/errors.hpp"
#include "bufferfile/core/header.hpp"
#include "bufferfile/core/serializer.hpp"
#include "bufferfile/core/stream_io.hpp"

#include <limits>
#include <span>

namespace bufferfile::core {

  static void check_block_size(int32_t block_size) {
    if (block_size <= static_cast<int32_t>(BLOCK_PREFIX_SIZE)) throw InvalidBlockSizeError(block_size);
  }

  std::optional<uint64_t> block_offset(int64_t index, int32_t block_size) {
    if (index < 0 || block_size <= 0) return std::nullopt;
    // (index + 1) * block_size must not exceed the streamoff range
    constexpr int64_t MAX_OFFSET = std::numeric_limits<std::streamoff>::max();
    if (index >= MAX_OFFSET / block_size) return std::nullopt;
    return static_cast<uint64_t>(index + 1) * static_cast<uint64_t>(block_size);
  }

  size_t payload_size(int32_t block_size) {
    check_block_size(block_size);
    return static_cast<size_t>(block_size) - BLOCK_PREFIX_SIZE;
  }

  std::optional<BufferBlock> try_read_block(std::istream& in, int32_t block_size, int64_t index) {
    const size_t data_len = payload_size(block_size);
    auto offset = block_offset(index, block_size);
    if (!offset || !seek_to(in, *offset)) return std::nullopt;

    auto prefix = read_up_to(in, BLOCK_PREFIX_SIZE);
    if (prefix.size() < BLOCK_PREFIX_SIZE) return std::nullopt;

    BufferBlock block;
    ByteReader reader(std::span<const uint8_t>(prefix.data(), prefix.size()));
    block.flags = reader.read_u8();
    block.block_id = reader.read_i32();

    block.payload = read_up_to(in, data_len);
    if (block.payload.size() < data_len) return std::nullopt;
    return block;
  }

  BufferBlock read_block(std::istream& in, int32_t block_size, int64_t index) {
    auto block = try_read_block(in, block_size, index);
    if (!block) throw BlockOutOfRangeError(index);
    return std::move(*block);
  }
}
