#include "dependency_graph.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

namespace rehearse {

namespace {

entity_definition node(entity_type type,
                       std::string name,
                       std::optional<parent_ref> parent = std::nullopt) {
  return { .type = type, .name = std::move(name), .project_key = "GOV", .parent = parent };
}

}  // namespace

TEST_CASE("dependency_graph_build: edges follow parent references") {
  auto const graph{ dependency_graph_build(
      { node(entity_type::PROJECT, "Governance"),
        node(entity_type::STRATEGIC_OBJECTIVE,
             "Strengthen",
             parent_ref{ entity_type::PROJECT, "Governance" }),
        node(entity_type::PORTFOLIO_EPIC,
             "Controls",
             parent_ref{ entity_type::STRATEGIC_OBJECTIVE, "Strengthen" }) },
      {}) };

  REQUIRE(graph.size() == 3);
  CHECK_FALSE(graph.parent_index[0].has_value());
  CHECK(graph.parent_index[1] == 0u);
  CHECK(graph.parent_index[2] == 1u);
  CHECK(graph.children[0] == std::vector<std::size_t>{ 1 });
  CHECK(graph.children[1] == std::vector<std::size_t>{ 2 });
  CHECK(graph.children[2].empty());
}

TEST_CASE("dependency_graph_build: pre-existing parent becomes a root") {
  std::unordered_set<logical_identity> const pre_existing{
    { entity_type::PROJECT, "Governance", "GOV" }
  };
  auto const graph{ dependency_graph_build(
      { node(entity_type::STRATEGIC_OBJECTIVE,
             "Strengthen",
             parent_ref{ entity_type::PROJECT, "Governance" }) },
      pre_existing) };

  REQUIRE(graph.size() == 1);
  CHECK_FALSE(graph.parent_index[0].has_value());
}

TEST_CASE("dependency_graph_build: parent type disambiguates same names") {
  auto const graph{ dependency_graph_build(
      { node(entity_type::PROJECT, "Audit"),
        node(entity_type::STRATEGIC_OBJECTIVE, "Audit", parent_ref{ entity_type::PROJECT, "Audit" }),
        node(entity_type::PORTFOLIO_EPIC,
             "Audit",
             parent_ref{ entity_type::STRATEGIC_OBJECTIVE, "Audit" }) },
      {}) };
  CHECK(graph.parent_index[2] == 1u);
}

TEST_CASE("dependency_graph_build: dangling parent") {
  CHECK_THROWS_AS(dependency_graph_build({ node(entity_type::PORTFOLIO_EPIC,
                                                "Controls",
                                                parent_ref{ entity_type::STRATEGIC_OBJECTIVE,
                                                            "Nowhere" }) },
                                         {}),
                  dangling_parent_error);
}

TEST_CASE("dependency_graph_build: duplicate identity") {
  CHECK_THROWS_WITH_AS(dependency_graph_build({ node(entity_type::PROJECT, "Governance"),
                                                node(entity_type::PROJECT, "Governance") },
                                              {}),
                       "Duplicate entity in catalog: project:GOV/Governance",
                       validation_error);
}

TEST_CASE("dependency_graph_build: two-node cycle") {
  CHECK_THROWS_WITH_AS(
      dependency_graph_build(
          { node(entity_type::PORTFOLIO_EPIC, "A", parent_ref{ entity_type::PORTFOLIO_EPIC, "B" }),
            node(entity_type::PORTFOLIO_EPIC, "B", parent_ref{ entity_type::PORTFOLIO_EPIC, "A" }) },
          {}),
      "Parent cycle detected: portfolio_epic:GOV/A -> portfolio_epic:GOV/B -> "
      "portfolio_epic:GOV/A",
      cycle_error);
}

TEST_CASE("dependency_graph_build: self parent") {
  CHECK_THROWS_WITH_AS(
      dependency_graph_build(
          { node(entity_type::FEATURE, "Loop", parent_ref{ entity_type::FEATURE, "Loop" }) }, {}),
      "Parent cycle detected: feature:GOV/Loop -> feature:GOV/Loop",
      cycle_error);
}

TEST_CASE("dependency_graph_build: cycle reached from an acyclic tail") {
  CHECK_THROWS_AS(
      dependency_graph_build(
          { node(entity_type::FEATURE, "Tail", parent_ref{ entity_type::BUSINESS_OUTCOME, "X" }),
            node(entity_type::BUSINESS_OUTCOME, "X", parent_ref{ entity_type::PORTFOLIO_EPIC, "Y" }),
            node(entity_type::PORTFOLIO_EPIC, "Y", parent_ref{ entity_type::BUSINESS_OUTCOME, "X" }) },
          {}),
      cycle_error);
}

}  // namespace rehearse
