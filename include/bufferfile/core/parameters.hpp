#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bufferfile::core {

  // Immutable name -> value table. Iterates in insertion order.
  class UserParameters {
    public:
      using Entry = std::pair<std::string, int32_t>;
      using const_iterator = std::vector<Entry>::const_iterator;

      UserParameters() = default;

      // A repeated name replaces the earlier value and keeps the earlier position.
      static UserParameters from_entries(std::vector<Entry> entries);

      std::optional<int32_t> find(std::string_view name) const;
      bool contains(std::string_view name) const { return find(name).has_value(); }

      size_t size() const { return entries_.size(); }
      bool empty() const { return entries_.empty(); }
      const std::vector<Entry>& entries() const { return entries_; }

      const_iterator begin() const { return entries_.begin(); }
      const_iterator end() const { return entries_.end(); }

    private:
      std::vector<Entry> entries_;
  };

  // Seeks to offset 32 and decodes `count` {i32 len, name, i32 value} entries.
  // Throws TruncatedParameterError on any short field.
  UserParameters read_user_parameters(std::istream& in, int32_t count);
}
