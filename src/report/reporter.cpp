#include "bufferfile/report/reporter.hpp"
#include "bufferfile/core/errors.hpp"
#include "bufferfile/core/hash.hpp"

#include <span>

using namespace bufferfile::core;

namespace bufferfile::report {

  static void print_header(const FileHeader& header, std::ostream& out) {
    out << "Magic Number: " << std::hex << static_cast<uint64_t>(header.magic_number) << std::dec << "\n";
    out << "File ID: " << header.file_id << "\n";
    out << "Version: " << header.version << "\n";
    out << "Block Size: " << header.block_size << "\n";
    out << "First Free Block: " << header.first_free_block << "\n";
    out << "User Parameter Count: " << header.param_count << "\n";
  }

  // Lists blocks from index 0 and returns how many were read.
  static int64_t print_blocks(storage::BlockFile& file, std::ostream& out, bool digest) {
    out << "Blocks:\n";
    int64_t index = 0;
    for (;; ++index) {
      auto block = file.try_read_block(index);
      if (!block) break;
      out << "  [" << index << "] " << (block->is_empty() ? "empty" : "used ")
          << " id=" << block->block_id;
      if (digest) {
        auto hash = sha256(std::span<const uint8_t>(block->payload.data(), block->payload.size()));
        out << " sha256=" << to_hex(hash);
      }
      out << "\n";
    }
    return index;
  }

  static void print_free_chain(storage::BlockFile& file, std::ostream& out) {
    try {
      auto chain = file.free_chain();
      out << "Free Chain (" << chain.size() << "):";
      for (auto index : chain) out << " " << index;
      out << "\n";
    } catch (const FreeChainError& ex) {
      out << "[!] " << ex.what() << "\n";
    }
  }

  void report(storage::BlockFile& file, std::ostream& out, const ReportOptions& options) {
    print_header(file.header(), out);
    if (file.header().param_count > 0) {
      out << "User Parameters:\n";
      for (const auto& [name, value] : file.parameters()) out << "  " << name << ": " << value << "\n";
    }

    const bool list = options.list_blocks || options.digest;
    const int64_t block_count = list ? print_blocks(file, out, options.digest) : file.count_blocks();
    if (options.free_chain) print_free_chain(file, out);

    out << "Number of blocks read: " << block_count << "\n";
    if (auto extra = file.trailing_bytes(block_count); extra > 0) {
      out << "[!] " << extra << " trailing bytes after the last full block\n";
    }
  }
}
