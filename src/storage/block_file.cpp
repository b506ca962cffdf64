#include "bufferfile/storage/block_file.hpp"
#include "bufferfile/core/errors.hpp"

#include <set>
#include <string>

using namespace bufferfile::core;

namespace bufferfile::storage {

  BlockFile::BlockFile(std::filesystem::path path) : path_(std::move(path)) {
    in_.open(path_, std::ios::binary);
    if (!in_) throw FileOpenError("BlockFile: cannot open " + path_.string());
    header_ = read_header(in_);
    params_ = read_user_parameters(in_, header_.param_count);
  }

  std::optional<BufferBlock> BlockFile::try_read_block(int64_t index) {
    return core::try_read_block(in_, header_.block_size, index);
  }

  BufferBlock BlockFile::read_block(int64_t index) {
    return core::read_block(in_, header_.block_size, index);
  }

  int64_t BlockFile::count_blocks() {
    int64_t index = 0;
    while (try_read_block(index)) ++index;
    return index;
  }

  uint64_t BlockFile::file_size() {
    in_.clear();
    in_.seekg(0, std::ios::end);
    const auto end = in_.tellg();
    if (end < 0) throw BlockFileError("BlockFile: cannot determine size of " + path_.string());
    return static_cast<uint64_t>(end);
  }

  uint64_t BlockFile::trailing_bytes() { return trailing_bytes(count_blocks()); }

  uint64_t BlockFile::trailing_bytes(int64_t block_count) {
    const auto blocks_end = block_offset(block_count, header_.block_size);
    const uint64_t size = file_size();
    if (!blocks_end) return 0;
    return size > *blocks_end ? size - *blocks_end : 0;
  }

  std::vector<int32_t> BlockFile::free_chain() {
    std::vector<int32_t> chain;
    std::set<int32_t> visited;
    int32_t index = header_.first_free_block;
    while (index != END_OF_CHAIN) {
      if (index < 0) throw FreeChainError("free chain: invalid link " + std::to_string(index));
      if (!visited.insert(index).second) throw FreeChainError("free chain: cycle at block " + std::to_string(index));

      auto block = try_read_block(index);
      if (!block) throw FreeChainError("free chain: block " + std::to_string(index) + " out of range");
      if (!block->is_empty()) throw FreeChainError("free chain: block " + std::to_string(index) + " is not empty");

      chain.push_back(index);
      index = block->block_id;
    }
    return chain;
  }
}
