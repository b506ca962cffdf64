#pragma once
#include <algorithm>
#include <cstdint>
#include <istream>
#include <vector>

namespace bufferfile::core {

  // Positions `in` at `offset`, clearing any eof/fail state left by an earlier short read.
  inline bool seek_to(std::istream& in, uint64_t offset) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    return static_cast<bool>(in);
  }

  // Reads up to `len` bytes. A short result means end of file.
  // Allocation is bounded by the bytes actually present, not by `len`.
  inline std::vector<uint8_t> read_up_to(std::istream& in, size_t len) {
    constexpr size_t CHUNK = 64 * 1024;
    std::vector<uint8_t> out;
    while (out.size() < len) {
      const size_t want = std::min(CHUNK, len - out.size());
      const size_t have = out.size();
      out.resize(have + want);
      in.read(reinterpret_cast<char*>(out.data() + have), static_cast<std::streamsize>(want));
      const auto got = static_cast<size_t>(in.gcount());
      if (got < want) {
        out.resize(have + got);
        break;
      }
    }
    return out;
  }
}
