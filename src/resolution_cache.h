#pragma once

#include "entity.h"
#include "tracker_client.h"

#include <tbb/concurrent_hash_map.h>
#include <tbb/concurrent_unordered_set.h>

#include <cstddef>
#include <optional>
#include <string>

namespace rehearse {

struct resolved_entity {
  logical_identity identity;
  tracker_ref ref;
  bool created_this_run{ false };
};

// Logical identity -> tracker ref for one run. Entries are write-once: the
// first writer wins and later inserts for the same identity are ignored.
class resolution_cache {
 public:
  // Returns false if the identity was already present.
  bool insert(resolved_entity entry);

  std::optional<resolved_entity> find(logical_identity const &identity) const;

  void mark_failed(logical_identity const &identity);
  bool failed(logical_identity const &identity) const;

  std::size_t size() const { return entries_.size(); }

 private:
  using map_t = tbb::concurrent_hash_map<std::string, resolved_entity>;

  map_t entries_;
  tbb::concurrent_unordered_set<std::string> failed_;
};

}  // namespace rehearse
