#include "bufferfile/core/parameters.hpp"
#include "bufferfile/core/errors.hpp"
#include "bufferfile/core/header.hpp"
#include "bufferfile/core/serializer.hpp"
#include "bufferfile/core/stream_io.hpp"

#include <algorithm>
#include <span>

namespace bufferfile::core {

  UserParameters UserParameters::from_entries(std::vector<Entry> entries) {
    UserParameters params;
    params.entries_.reserve(entries.size());
    for (auto& entry : entries) {
      auto it = std::find_if(params.entries_.begin(), params.entries_.end(),
                             [&](const Entry& e) { return e.first == entry.first; });
      if (it != params.entries_.end()) {
        it->second = entry.second;
      } else {
        params.entries_.push_back(std::move(entry));
      }
    }
    return params;
  }

  std::optional<int32_t> UserParameters::find(std::string_view name) const {
    for (const auto& [key, value] : entries_) {
      if (key == name) return value;
    }
    return std::nullopt;
  }

  // Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
  static bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
      const uint8_t lead = bytes[i];
      size_t extra = 0;
      uint8_t lo = 0x80, hi = 0xBF;
      if (lead < 0x80) { ++i; continue; }
      else if (lead >= 0xC2 && lead <= 0xDF) extra = 1;
      else if (lead == 0xE0) { extra = 2; lo = 0xA0; }
      else if (lead == 0xED) { extra = 2; hi = 0x9F; }
      else if (lead >= 0xE1 && lead <= 0xEF) extra = 2;
      else if (lead == 0xF0) { extra = 3; lo = 0x90; }
      else if (lead == 0xF4) { extra = 3; hi = 0x8F; }
      else if (lead >= 0xF1 && lead <= 0xF3) extra = 3;
      else return false;

      if (bytes.size() - i <= extra) return false;
      if (bytes[i + 1] < lo || bytes[i + 1] > hi) return false;
      for (size_t k = 2; k <= extra; ++k) {
        if ((bytes[i + k] & 0xC0) != 0x80) return false;
      }
      i += extra + 1;
    }
    return true;
  }

  static int32_t read_i32_field(std::istream& in, int32_t index, const char* field) {
    auto bytes = read_up_to(in, 4);
    if (bytes.size() < 4) throw TruncatedParameterError(index, field);
    ByteReader reader(std::span<const uint8_t>(bytes.data(), bytes.size()));
    return reader.read_i32();
  }

  UserParameters read_user_parameters(std::istream& in, int32_t count) {
    std::vector<UserParameters::Entry> entries;
    if (count <= 0) return UserParameters{};
    if (!seek_to(in, HEADER_SIZE)) throw TruncatedParameterError(0, "name length");

    for (int32_t i = 0; i < count; ++i) {
      const int32_t name_length = read_i32_field(in, i, "name length");
      if (name_length < 0) throw TruncatedParameterError(i, "name");

      auto name_bytes = read_up_to(in, static_cast<size_t>(name_length));
      if (name_bytes.size() < static_cast<size_t>(name_length)) throw TruncatedParameterError(i, "name");
      if (!is_valid_utf8(name_bytes)) throw InvalidParameterNameError(i);
      std::string name(name_bytes.begin(), name_bytes.end());

      const int32_t value = read_i32_field(in, i, "value");
      entries.emplace_back(std::move(name), value);
    }
    return UserParameters::from_entries(std::move(entries));
  }
}
