#pragma once

#include "dependency_graph.h"
#include "tracker_client.h"

#include <cstddef>
#include <vector>

namespace rehearse {

// Level i holds graph indices whose parents sit in levels < i or pre-exist.
// Each level is sorted by catalog order.
struct run_plan {
  std::vector<std::vector<std::size_t>> levels;

  std::size_t entity_count() const;
};

run_plan planner_build_run_plan(dependency_graph const &graph);

// Live structure discovered in the tracker prior to teardown.
struct discovered_node {
  tracker_entity entity;
  std::vector<std::size_t> children;  // Indices into teardown_plan::nodes
};

// Levels ordered leaves first: level 0 holds nodes of height 0.
struct teardown_plan {
  std::vector<discovered_node> nodes;
  std::vector<std::vector<std::size_t>> levels;
};

teardown_plan planner_build_teardown_plan(std::vector<discovered_node> nodes);

}  // namespace rehearse
