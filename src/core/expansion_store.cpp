#include "core/expansion_store.hpp"

namespace connmgr_tui {

bool ExpansionStore::get(const NodeKey &key) const {
  auto it = flags_.find(key);
  return it != flags_.end() && it->second;
}

void ExpansionStore::set(const NodeKey &key, bool expanded) { flags_[key] = expanded; }

bool ExpansionStore::toggle(const NodeKey &key) {
  bool &flag = flags_[key];
  flag = !flag;
  return flag;
}

} // namespace connmgr_tui
