#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>
#include "bufferfile/core/header.hpp"
#include "bufferfile/core/serializer.hpp"

namespace fixture {
  namespace fs = std::filesystem;
  using bufferfile::core::ByteWriter;
  using bufferfile::core::FileHeader;

  inline fs::path tmpfile(const std::string& name) {
    auto dir = fs::temp_directory_path() / "bufferfile_tests";
    fs::create_directories(dir);
    auto p = dir / name;
    fs::remove(p);
    return p;
  }

  inline fs::path write_file(const std::string& name, const std::vector<uint8_t>& bytes) {
    auto p = tmpfile(name);
    std::ofstream out(p, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return p;
  }

  inline FileHeader make_header(int32_t block_size, int32_t param_count, int32_t first_free = -1) {
    FileHeader header;
    header.magic_number = 0x1122334455667788LL;
    header.file_id = 99;
    header.version = 1;
    header.block_size = block_size;
    header.first_free_block = first_free;
    header.param_count = param_count;
    return header;
  }

  // Header block: header + parameter table, zero padded to block_size.
  inline std::vector<uint8_t> header_block(const FileHeader& header,
                                           const std::vector<std::pair<std::string, int32_t>>& params) {
    ByteWriter writer;
    auto header_bytes = header.serialize();
    writer.write_raw(header_bytes);
    for (const auto& [name, value] : params) {
      writer.write_string(name);
      writer.write_i32(value);
    }
    auto bytes = writer.take();
    if (bytes.size() < static_cast<size_t>(header.block_size)) bytes.resize(header.block_size, 0);
    return bytes;
  }

  inline void append_block(std::vector<uint8_t>& file, int32_t block_size, uint8_t flags, int32_t block_id,
                           uint8_t fill = 0) {
    ByteWriter writer;
    writer.write_u8(flags);
    writer.write_i32(block_id);
    std::vector<uint8_t> payload(static_cast<size_t>(block_size) - 5, fill);
    writer.write_raw(payload);
    auto bytes = writer.take();
    file.insert(file.end(), bytes.begin(), bytes.end());
  }
}
