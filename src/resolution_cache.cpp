#include "resolution_cache.h"

#include <utility>

namespace rehearse {

bool resolution_cache::insert(resolved_entity entry) {
  map_t::accessor acc;
  if (!entries_.insert(acc, entry.identity.canonical())) { return false; }
  acc->second = std::move(entry);
  return true;
}

std::optional<resolved_entity> resolution_cache::find(
    logical_identity const &identity) const {
  map_t::const_accessor acc;
  if (!entries_.find(acc, identity.canonical())) { return std::nullopt; }
  return acc->second;
}

void resolution_cache::mark_failed(logical_identity const &identity) {
  failed_.insert(identity.canonical());
}

bool resolution_cache::failed(logical_identity const &identity) const {
  return failed_.count(identity.canonical()) > 0;
}

}  // namespace rehearse
