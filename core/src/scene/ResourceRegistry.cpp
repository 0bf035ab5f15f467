#include "lrc/scene/ResourceRegistry.hpp"
#include <algorithm>

namespace lrc {

Id ResourceRegistry::allocate(ResourceKind kind) {
  // a client may have reserved an id in the auto range explicitly
  while (entries_.count(nextAuto_) != 0) ++nextAuto_;
  const Id id = nextAuto_++;
  entries_.emplace(id, kind);
  return id;
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  return entries_.emplace(id, kind).second;
}

bool ResourceRegistry::release(Id id) {
  return entries_.erase(id) != 0;
}

bool ResourceRegistry::lookup(Id id, ResourceKind& kind) const {
  const auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  kind = it->second;
  return true;
}

std::size_t ResourceRegistry::count(ResourceKind kind) const {
  return static_cast<std::size_t>(std::count_if(
    entries_.begin(), entries_.end(),
    [kind](const std::pair<const Id, ResourceKind>& e) { return e.second == kind; }));
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> ids;
  ids.reserve(count(kind));
  for (const auto& e : entries_)
    if (e.second == kind) ids.push_back(e.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace lrc
