#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace bufferfile::core {

  struct BlockFileError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  struct FileOpenError : BlockFileError {
    using BlockFileError::BlockFileError;
  };

  struct TruncatedHeaderError : BlockFileError {
    explicit TruncatedHeaderError(size_t available)
      : BlockFileError("file is too short to contain a valid header (" + std::to_string(available) + " of 32 bytes)"),
        available_bytes(available) {}
    size_t available_bytes;
  };

  struct UnsupportedVersionError : BlockFileError {
    explicit UnsupportedVersionError(int32_t v)
      : BlockFileError("unsupported block file header version " + std::to_string(v)), version(v) {}
    int32_t version;
  };

  struct TruncatedParameterError : BlockFileError {
    TruncatedParameterError(int32_t index, const std::string& field)
      : BlockFileError("unexpected end of file while reading parameter " + std::to_string(index) + " " + field),
        parameter_index(index) {}
    int32_t parameter_index;
  };

  struct InvalidParameterNameError : BlockFileError {
    explicit InvalidParameterNameError(int32_t index)
      : BlockFileError("parameter " + std::to_string(index) + " name is not valid UTF-8"), parameter_index(index) {}
    int32_t parameter_index;
  };

  struct BlockOutOfRangeError : BlockFileError {
    explicit BlockOutOfRangeError(int64_t index)
      : BlockFileError("block index " + std::to_string(index) + " out of range"), block_index(index) {}
    int64_t block_index;
  };

  struct InvalidBlockSizeError : BlockFileError {
    explicit InvalidBlockSizeError(int32_t size)
      : BlockFileError("block size " + std::to_string(size) + " cannot hold a block prefix"), block_size(size) {}
    int32_t block_size;
  };

  struct FreeChainError : BlockFileError {
    using BlockFileError::BlockFileError;
  };
}
