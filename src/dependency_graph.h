#pragma once

#include "entity.h"

#include <cstddef>
#include <optional>
#include <unordered_set>
#include <vector>

namespace rehearse {

// Entities in catalog order with parent -> child edges. A node without a
// parent_index is a root: it either has no parent or its parent pre-exists.
struct dependency_graph {
  std::vector<entity_definition> entities;
  std::vector<std::optional<std::size_t>> parent_index;
  std::vector<std::vector<std::size_t>> children;

  std::size_t size() const { return entities.size(); }
};

// Throws validation_error on a repeated identity, dangling_parent_error when a
// parent is neither in the catalog nor pre-existing, cycle_error when a parent
// chain loops back on itself.
dependency_graph dependency_graph_build(
    std::vector<entity_definition> entities,
    std::unordered_set<logical_identity> const &pre_existing);

}  // namespace rehearse
