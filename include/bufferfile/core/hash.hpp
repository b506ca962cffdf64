#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace bufferfile::core {
  using Hash256 = std::array<uint8_t, 32>;

  struct DigestError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  auto sha256(std::span<const uint8_t> data) -> Hash256;

  inline auto sha256(const std::string& data) -> Hash256 {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  }

  auto to_hex(std::span<const uint8_t> data) -> std::string;
}
