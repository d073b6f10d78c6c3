#include "planner.h"

#include "errors.h"

#include <algorithm>
#include <utility>

namespace rehearse {

std::size_t run_plan::entity_count() const {
  std::size_t count{ 0 };
  for (auto const &level : levels) { count += level.size(); }
  return count;
}

run_plan planner_build_run_plan(dependency_graph const &graph) {
  std::size_t const n{ graph.size() };
  std::vector<std::size_t> in_degree(n, 0);
  for (std::size_t i{ 0 }; i < n; ++i) {
    if (graph.parent_index[i]) { in_degree[i] = 1; }
  }

  run_plan plan;
  std::vector<std::size_t> frontier;
  for (std::size_t i{ 0 }; i < n; ++i) {
    if (in_degree[i] == 0) { frontier.push_back(i); }
  }

  std::size_t placed{ 0 };
  while (!frontier.empty()) {
    std::ranges::sort(frontier);
    placed += frontier.size();

    std::vector<std::size_t> next;
    for (auto const idx : frontier) {
      for (auto const child : graph.children[idx]) {
        if (--in_degree[child] == 0) { next.push_back(child); }
      }
    }

    plan.levels.push_back(std::move(frontier));
    frontier = std::move(next);
  }

  if (placed != n) {
    throw cycle_error("Dependency graph contains a cycle; " + std::to_string(n - placed) +
                      " entities could not be scheduled");
  }

  return plan;
}

teardown_plan planner_build_teardown_plan(std::vector<discovered_node> nodes) {
  std::size_t const n{ nodes.size() };
  constexpr std::size_t kUnknown{ static_cast<std::size_t>(-1) };
  std::vector<std::size_t> height(n, kUnknown);
  std::vector<bool> on_stack(n, false);

  // Iterative post-order: a node's height is one more than its tallest child.
  for (std::size_t root{ 0 }; root < n; ++root) {
    if (height[root] != kUnknown) { continue; }

    std::vector<std::pair<std::size_t, std::size_t>> stack{ { root, 0 } };
    on_stack[root] = true;
    while (!stack.empty()) {
      auto &[idx, next_child]{ stack.back() };
      auto const &children{ nodes[idx].children };

      if (next_child < children.size()) {
        std::size_t const child{ children[next_child++] };
        if (height[child] != kUnknown) { continue; }
        if (on_stack[child]) {
          throw cycle_error("Discovered structure loops back through " +
                            nodes[child].entity.ref.id);
        }
        on_stack[child] = true;
        stack.emplace_back(child, 0);
        continue;
      }

      std::size_t h{ 0 };
      for (auto const child : children) { h = std::max(h, height[child] + 1); }
      height[idx] = h;
      on_stack[idx] = false;
      stack.pop_back();
    }
  }

  teardown_plan plan{ .nodes = std::move(nodes) };
  for (std::size_t i{ 0 }; i < n; ++i) {
    if (plan.levels.size() <= height[i]) { plan.levels.resize(height[i] + 1); }
    plan.levels[height[i]].push_back(i);
  }
  return plan;
}

}  // namespace rehearse
