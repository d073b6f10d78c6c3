#include "dependency_graph.h"

#include "errors.h"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace rehearse {

namespace {

enum class visit_state { UNVISITED, IN_PROGRESS, DONE };

void check_acyclic(dependency_graph const &graph) {
  std::vector<visit_state> state(graph.size(), visit_state::UNVISITED);
  std::vector<std::size_t> chain;

  for (std::size_t start{ 0 }; start < graph.size(); ++start) {
    if (state[start] != visit_state::UNVISITED) { continue; }

    // Walk the parent chain iteratively; a node seen twice on the same walk is a cycle.
    chain.clear();
    std::optional<std::size_t> cur{ start };
    while (cur && state[*cur] == visit_state::UNVISITED) {
      state[*cur] = visit_state::IN_PROGRESS;
      chain.push_back(*cur);
      cur = graph.parent_index[*cur];
    }

    if (cur && state[*cur] == visit_state::IN_PROGRESS) {
      auto const loop_start{ std::ranges::find(chain, *cur) };
      std::string msg{ "Parent cycle detected: " };
      for (auto it{ loop_start }; it != chain.end(); ++it) {
        msg += graph.entities[*it].identity().canonical();
        msg += " -> ";
      }
      msg += graph.entities[*cur].identity().canonical();
      throw cycle_error(msg);
    }

    for (auto const idx : chain) { state[idx] = visit_state::DONE; }
  }
}

}  // namespace

dependency_graph dependency_graph_build(
    std::vector<entity_definition> entities,
    std::unordered_set<logical_identity> const &pre_existing) {
  dependency_graph graph{ .entities = std::move(entities) };
  std::size_t const n{ graph.entities.size() };

  std::unordered_map<logical_identity, std::size_t> index_of;
  index_of.reserve(n);
  for (std::size_t i{ 0 }; i < n; ++i) {
    auto const [it, inserted]{ index_of.emplace(graph.entities[i].identity(), i) };
    if (!inserted) {
      throw validation_error("Duplicate entity in catalog: " + it->first.canonical());
    }
  }

  graph.parent_index.assign(n, std::nullopt);
  graph.children.assign(n, {});

  for (std::size_t i{ 0 }; i < n; ++i) {
    auto const parent{ graph.entities[i].parent_identity() };
    if (!parent) { continue; }

    if (auto const it{ index_of.find(*parent) }; it != index_of.end()) {
      graph.parent_index[i] = it->second;
      graph.children[it->second].push_back(i);
    } else if (!pre_existing.contains(*parent)) {
      throw dangling_parent_error("Parent " + parent->canonical() + " of " +
                                  graph.entities[i].identity().canonical() +
                                  " is neither in the catalog nor pre-existing");
    }
  }

  check_acyclic(graph);
  return graph;
}

}  // namespace rehearse
