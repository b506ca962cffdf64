#pragma once
#include <ostream>
#include <bufferfile/storage/block_file.hpp>

namespace bufferfile::report {
  struct ReportOptions {
    bool list_blocks = false;
    bool digest = false;      // payload sha256 per listed block; implies list_blocks
    bool free_chain = false;
  };

  // Writes the header, parameter table and block summary of `file` to `out`.
  void report(storage::BlockFile& file, std::ostream& out, const ReportOptions& options = {});
}
