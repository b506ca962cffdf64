#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>
#include <bufferfile/core/buffer_block.hpp>
#include <bufferfile/core/header.hpp>
#include <bufferfile/core/parameters.hpp>

namespace bufferfile::storage {

  // Read-only decode session over one block file. The handle stays open for
  // the session's lifetime; every read seeks explicitly first.
  class BlockFile {
    public:
      // Loads the header and parameter table; throws on either failure.
      explicit BlockFile(std::filesystem::path path);

      BlockFile(const BlockFile&) = delete;
      BlockFile& operator=(const BlockFile&) = delete;
      BlockFile(BlockFile&&) = default;
      BlockFile& operator=(BlockFile&&) = default;

      const std::filesystem::path& path() const { return path_; }
      const core::FileHeader& header() const { return header_; }
      const core::UserParameters& parameters() const { return params_; }

      std::optional<core::BufferBlock> try_read_block(int64_t index);
      core::BufferBlock read_block(int64_t index);

      // Number of consecutive full blocks readable from index 0.
      int64_t count_blocks();

      uint64_t file_size();
      // Bytes past the last full block; non-zero when the file ends mid-block.
      uint64_t trailing_bytes();
      // As above, with the result of a count_blocks() the caller already ran.
      uint64_t trailing_bytes(int64_t block_count);

      // Indices of the empty blocks reachable from first_free_block, in link order.
      std::vector<int32_t> free_chain();

    private:
      std::filesystem::path path_;
      std::ifstream in_;
      core::FileHeader header_{};
      core::UserParameters params_;
  };
}
