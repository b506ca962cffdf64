#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include "bufferfile/core/buffer_block.hpp"
#include "bufferfile/core/errors.hpp"
#include "fixture.hpp"

using namespace bufferfile::core;

static std::istringstream as_stream(const std::vector<uint8_t>& bytes) {
  return std::istringstream(std::string(bytes.begin(), bytes.end()), std::ios::binary);
}

static std::vector<uint8_t> file_with_blocks(int32_t block_size, int n) {
  auto bytes = fixture::header_block(fixture::make_header(block_size, 0), {});
  for (int i = 0; i < n; ++i) fixture::append_block(bytes, block_size, 0, 100 + i, static_cast<uint8_t>(i));
  return bytes;
}

TEST(BufferBlock, OffsetSkipsHeaderBlock) {
  EXPECT_EQ(block_offset(0, 64).value_or(0), 64u);
  EXPECT_EQ(block_offset(3, 64).value_or(0), 256u);
  EXPECT_EQ(block_offset(0x7FFFFFFF, 0x7FFFFFFF).value_or(0), 0x80000000ULL * 0x7FFFFFFFULL);
  EXPECT_FALSE(block_offset(-1, 64).has_value());
  EXPECT_EQ(payload_size(64), 59u);
}

TEST(BufferBlock, OffsetPastSeekableRangeIsRejected) {
  constexpr int64_t max = std::numeric_limits<int64_t>::max();
  EXPECT_FALSE(block_offset((1LL << 58) - 1, 64).has_value());
  EXPECT_FALSE(block_offset(max, 64).has_value());
  EXPECT_FALSE(block_offset(max, 6).has_value());
  EXPECT_EQ(block_offset(max / 64 - 1, 64).value_or(0), static_cast<uint64_t>(max / 64) * 64u);
}

TEST(BufferBlock, HugeIndexDoesNotWrapOntoHeader) {
  auto bytes = file_with_blocks(64, 1);
  auto in = as_stream(bytes);
  for (int64_t index : std::initializer_list<int64_t>{(1LL << 58) - 1, std::numeric_limits<int64_t>::max()}) {
    EXPECT_FALSE(try_read_block(in, 64, index).has_value()) << "index " << index;
    try {
      (void)read_block(in, 64, index);
      FAIL() << "expected BlockOutOfRangeError for index " << index;
    } catch (const BlockOutOfRangeError& ex) {
      EXPECT_EQ(ex.block_index, index);
    }
  }
  EXPECT_EQ(read_block(in, 64, 0).block_id, 100);
}

TEST(BufferBlock, ReadsPrefixAndPayload) {
  auto bytes = file_with_blocks(48, 2);
  auto in = as_stream(bytes);
  auto block = read_block(in, 48, 1);
  EXPECT_EQ(block.flags, 0);
  EXPECT_FALSE(block.is_empty());
  EXPECT_EQ(block.block_id, 101);
  EXPECT_EQ(block.payload, std::vector<uint8_t>(43, 1));
}

TEST(BufferBlock, EmptyFlagIsBitZero) {
  auto bytes = fixture::header_block(fixture::make_header(48, 0, 0), {});
  fixture::append_block(bytes, 48, 0x03, END_OF_CHAIN);
  fixture::append_block(bytes, 48, 0x02, 9);
  auto in = as_stream(bytes);
  auto empty = read_block(in, 48, 0);
  EXPECT_TRUE(empty.is_empty());
  EXPECT_EQ(empty.block_id, -1);
  EXPECT_FALSE(read_block(in, 48, 1).is_empty());
}

TEST(BufferBlock, NFullBlocksThenOutOfRange) {
  constexpr int N = 4;
  auto bytes = file_with_blocks(32, N);
  auto in = as_stream(bytes);
  for (int i = 0; i < N; ++i) {
    auto block = try_read_block(in, 32, i);
    ASSERT_TRUE(block.has_value()) << "index " << i;
    EXPECT_EQ(block->block_id, 100 + i);
  }
  EXPECT_FALSE(try_read_block(in, 32, N).has_value());
  try {
    (void)read_block(in, 32, N);
    FAIL() << "expected BlockOutOfRangeError";
  } catch (const BlockOutOfRangeError& ex) {
    EXPECT_EQ(ex.block_index, N);
  }
}

TEST(BufferBlock, PartialBlockIsOutOfRange) {
  auto bytes = file_with_blocks(32, 2);
  bytes.resize(bytes.size() - 1);
  auto in = as_stream(bytes);
  EXPECT_TRUE(try_read_block(in, 32, 0).has_value());
  EXPECT_THROW(read_block(in, 32, 1), BlockOutOfRangeError);

  auto prefix_only = file_with_blocks(32, 0);
  prefix_only.push_back(0);
  prefix_only.push_back(0);
  auto short_id = as_stream(prefix_only);
  EXPECT_FALSE(try_read_block(short_id, 32, 0).has_value());
}

TEST(BufferBlock, RecoversAfterFailedRead) {
  auto bytes = file_with_blocks(48, 1);
  auto in = as_stream(bytes);
  EXPECT_FALSE(try_read_block(in, 48, 5).has_value());
  EXPECT_EQ(read_block(in, 48, 0).block_id, 100);
}

TEST(BufferBlock, NegativeIndexIsOutOfRange) {
  auto bytes = file_with_blocks(48, 1);
  auto in = as_stream(bytes);
  EXPECT_FALSE(try_read_block(in, 48, -1).has_value());
  EXPECT_THROW(read_block(in, 48, -1), BlockOutOfRangeError);
}

TEST(BufferBlock, BlockSizeMustExceedPrefix) {
  auto bytes = file_with_blocks(48, 1);
  auto in = as_stream(bytes);
  EXPECT_THROW(try_read_block(in, 5, 0), InvalidBlockSizeError);
  EXPECT_THROW(try_read_block(in, 0, 0), InvalidBlockSizeError);
  EXPECT_THROW(read_block(in, -64, 0), InvalidBlockSizeError);
}
