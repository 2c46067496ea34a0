#include <sxb/attribute_map.hpp>

namespace sxb {

  void
  attribute_map::insert_or_assign(std::string name, std::string value) {
    auto it = index_.find(name);
    if (it != index_.end()) {
      entries_[it->second].second = std::move(value);
      return;
    }
    index_.emplace(name, entries_.size());
    entries_.emplace_back(std::move(name), std::move(value));
  }

  const std::string*
  attribute_map::find(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
  }

} // namespace sxb
