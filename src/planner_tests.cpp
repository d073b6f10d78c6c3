#include "planner.h"

#include "catalog.h"
#include "errors.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

namespace rehearse {

namespace {

using levels_t = std::vector<std::vector<std::size_t>>;

entity_definition node(entity_type type,
                       std::string name,
                       std::optional<parent_ref> parent = std::nullopt) {
  return { .type = type, .name = std::move(name), .project_key = "AIOPS", .parent = parent };
}

discovered_node live(std::string id, std::vector<std::size_t> children) {
  return { .entity = { .ref = { entity_type::BUSINESS_OUTCOME, id }, .name = id },
           .children = std::move(children) };
}

}  // namespace

TEST_CASE("planner_build_run_plan: project, objective, two epics") {
  auto const graph{ dependency_graph_build(
      { node(entity_type::PROJECT, "AI Ops"),
        node(entity_type::STRATEGIC_OBJECTIVE, "Automate", parent_ref{ entity_type::PROJECT, "AI Ops" }),
        node(entity_type::PORTFOLIO_EPIC,
             "Triage",
             parent_ref{ entity_type::STRATEGIC_OBJECTIVE, "Automate" }),
        node(entity_type::PORTFOLIO_EPIC,
             "Remediate",
             parent_ref{ entity_type::STRATEGIC_OBJECTIVE, "Automate" }) },
      {}) };

  auto const plan{ planner_build_run_plan(graph) };
  CHECK(plan.levels == levels_t{ { 0 }, { 1 }, { 2, 3 } });
  CHECK(plan.entity_count() == 4);
}

TEST_CASE("planner_build_run_plan: ties follow catalog order") {
  // Children listed before their parents still land in catalog order per level.
  auto const graph{ dependency_graph_build(
      { node(entity_type::PORTFOLIO_EPIC, "E2", parent_ref{ entity_type::STRATEGIC_OBJECTIVE, "O2" }),
        node(entity_type::STRATEGIC_OBJECTIVE, "O2"),
        node(entity_type::PORTFOLIO_EPIC, "E1", parent_ref{ entity_type::STRATEGIC_OBJECTIVE, "O1" }),
        node(entity_type::STRATEGIC_OBJECTIVE, "O1") },
      {}) };

  auto const plan{ planner_build_run_plan(graph) };
  CHECK(plan.levels == levels_t{ { 1, 3 }, { 0, 2 } });
}

TEST_CASE("planner_build_run_plan: deterministic for identical catalogs") {
  auto const a{ catalog_select(catalog_builtin(), all_phases()) };
  auto const b{ catalog_select(catalog_builtin(), all_phases()) };

  auto const plan_a{ planner_build_run_plan(dependency_graph_build(a.entities, a.pre_existing)) };
  auto const plan_b{ planner_build_run_plan(dependency_graph_build(b.entities, b.pre_existing)) };
  CHECK(plan_a.levels == plan_b.levels);
}

TEST_CASE("planner_build_run_plan: parents always precede children") {
  auto const selection{ catalog_select(catalog_builtin(), all_phases()) };
  auto const graph{ dependency_graph_build(selection.entities, selection.pre_existing) };
  auto const plan{ planner_build_run_plan(graph) };

  std::vector<std::size_t> level_of(graph.size(), 0);
  for (std::size_t l{ 0 }; l < plan.levels.size(); ++l) {
    for (auto const idx : plan.levels[l]) { level_of[idx] = l; }
  }
  for (std::size_t i{ 0 }; i < graph.size(); ++i) {
    if (graph.parent_index[i]) { CHECK(level_of[*graph.parent_index[i]] < level_of[i]); }
  }
  CHECK(plan.entity_count() == graph.size());
}

TEST_CASE("planner_build_teardown_plan: levels by height, leaves first") {
  // 0 -> {1, 2}, 1 -> {3}; 4 is an isolated leaf
  auto const plan{ planner_build_teardown_plan({ live("root", { 1, 2 }),
                                                 live("mid", { 3 }),
                                                 live("leaf-a", {}),
                                                 live("leaf-b", {}),
                                                 live("lonely", {}) }) };

  CHECK(plan.levels == levels_t{ { 2, 3, 4 }, { 1 }, { 0 } });
  CHECK(plan.nodes[0].entity.ref.id == "root");
}

TEST_CASE("planner_build_teardown_plan: shared child counted once") {
  auto const plan{ planner_build_teardown_plan(
      { live("a", { 2 }), live("b", { 2 }), live("shared", {}) }) };
  CHECK(plan.levels == levels_t{ { 2 }, { 0, 1 } });
}

TEST_CASE("planner_build_teardown_plan: looping structure rejected") {
  CHECK_THROWS_AS(planner_build_teardown_plan({ live("a", { 1 }), live("b", { 0 }) }),
                  cycle_error);
}

TEST_CASE("planner_build_teardown_plan: empty") {
  CHECK(planner_build_teardown_plan({}).levels.empty());
}

}  // namespace rehearse
