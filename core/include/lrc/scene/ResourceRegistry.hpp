#pragma once
#include "lrc/scene/Types.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace lrc {

// Id ledger for scene objects. Recipes claim fixed ids inside their own block
// (idBase + offset); commands that omit an id are numbered from kAutoIdStart,
// above every recipe block.
class ResourceRegistry {
public:
  static constexpr Id kAutoIdStart = Id(1) << 32;

  Id allocate(ResourceKind kind);
  // False for id 0 or an id already in use.
  bool reserve(Id id, ResourceKind kind);
  bool release(Id id);

  bool contains(Id id) const { return entries_.count(id) != 0; }
  bool lookup(Id id, ResourceKind& kind) const;

  std::size_t count(ResourceKind kind) const;
  std::vector<Id> list(ResourceKind kind) const;  // ascending

private:
  Id nextAuto_{kAutoIdStart};
  std::unordered_map<Id, ResourceKind> entries_;
};

} // namespace lrc
