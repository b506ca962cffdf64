#include "bufferfile/core/header.hpp"
#include "bufferfile/core/errors.hpp"
#include "bufferfile/core/serializer.hpp"
#include "bufferfile/core/stream_io.hpp"

#include <array>

namespace bufferfile::core {
  namespace {
    using HeaderDecoder = FileHeader (*)(ByteReader&);

    // Version 1: magic(8) file_id(8) version(4) block_size(4) first_free(4) param_count(4)
    FileHeader decode_v1(ByteReader& reader) {
      FileHeader header;
      header.magic_number = reader.read_i64();
      header.file_id = reader.read_i64();
      header.version = reader.read_i32();
      header.block_size = reader.read_i32();
      header.first_free_block = reader.read_i32();
      header.param_count = reader.read_i32();
      return header;
    }

    struct VersionEntry {
      int32_t version;
      HeaderDecoder decode;
    };

    constexpr std::array<VersionEntry, 1> DECODERS{{
      {1, &decode_v1},
    }};

    // Every version shares the magic/file_id/version prefix.
    constexpr size_t VERSION_OFFSET = 16;

    HeaderDecoder find_decoder(int32_t version) {
      for (const auto& entry : DECODERS) {
        if (entry.version == version) return entry.decode;
      }
      return nullptr;
    }
  }

  bool is_supported_version(int32_t version) { return find_decoder(version) != nullptr; }

  std::vector<uint8_t> FileHeader::serialize() const {
    ByteWriter writer;
    writer.write_i64(magic_number);
    writer.write_i64(file_id);
    writer.write_i32(version);
    writer.write_i32(block_size);
    writer.write_i32(first_free_block);
    writer.write_i32(param_count);
    return writer.take();
  }

  FileHeader decode_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < HEADER_SIZE) throw TruncatedHeaderError(bytes.size());
    auto header_bytes = bytes.first(HEADER_SIZE);

    ByteReader peek(header_bytes.subspan(VERSION_OFFSET));
    const int32_t version = peek.read_i32();
    auto decode = find_decoder(version);
    if (!decode) throw UnsupportedVersionError(version);

    ByteReader reader(header_bytes);
    return decode(reader);
  }

  FileHeader read_header(std::istream& in) {
    if (!seek_to(in, 0)) throw TruncatedHeaderError(0);
    auto bytes = read_up_to(in, HEADER_SIZE);
    return decode_header(std::span<const uint8_t>(bytes.data(), bytes.size()));
  }
}
