#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sxb {

  // Attribute name -> value, iterated in first-insertion order.
  class attribute_map {
  public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    attribute_map() = default;

    // Append a new entry, or replace the value of an existing one in place.
    void
    insert_or_assign(std::string name, std::string value);

    const std::string*
    find(std::string_view name) const;

    bool
    contains(std::string_view name) const {
      return find(name) != nullptr;
    }

    std::size_t
    size() const {
      return entries_.size();
    }

    bool
    empty() const {
      return entries_.empty();
    }

    const_iterator
    begin() const {
      return entries_.begin();
    }

    const_iterator
    end() const {
      return entries_.end();
    }

    // Order-sensitive: the index is derived from entries_.
    bool
    operator==(const attribute_map& other) const {
      return entries_ == other.entries_;
    }

  private:
    std::vector<value_type> entries_;
    std::unordered_map<std::string, std::size_t> index_;
  };

} // namespace sxb
