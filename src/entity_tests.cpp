#include "entity.h"

#include <doctest/doctest.h>

#include <unordered_set>

namespace rehearse {

TEST_CASE("logical_identity: canonical form") {
  logical_identity const id{ .type = entity_type::PORTFOLIO_EPIC,
                             .name = "Build Golden Paths",
                             .project_key = "DEVEX" };
  CHECK(id.canonical() == "portfolio_epic:DEVEX/Build Golden Paths");
}

TEST_CASE("logical_identity: equality and hashing distinguish type and project") {
  logical_identity const a{ entity_type::FEATURE, "Login", "DEVEX" };
  logical_identity const b{ entity_type::FEATURE, "Login", "DATA" };
  logical_identity const c{ entity_type::BUSINESS_OUTCOME, "Login", "DEVEX" };
  logical_identity const d{ entity_type::FEATURE, "Login", "DEVEX" };

  CHECK(a == d);
  CHECK_FALSE(a == b);
  CHECK_FALSE(a == c);

  std::unordered_set<logical_identity> set{ a, b, c, d };
  CHECK(set.size() == 3);
}

TEST_CASE("entity_definition: parent identity inherits project") {
  entity_definition const def{ .type = entity_type::FEATURE,
                               .name = "Self-service environments",
                               .project_key = "DEVEX",
                               .parent = parent_ref{ entity_type::BUSINESS_OUTCOME,
                                                     "Faster onboarding" },
                               .attributes = { { "description", "d" } } };

  auto const parent{ def.parent_identity() };
  REQUIRE(parent.has_value());
  CHECK(parent->type == entity_type::BUSINESS_OUTCOME);
  CHECK(parent->name == "Faster onboarding");
  CHECK(parent->project_key == "DEVEX");
  CHECK(def.attribute("description") == "d");
  CHECK(def.attribute("missing").empty());
}

TEST_CASE("entity_definition: root has no parent identity") {
  entity_definition const def{ .type = entity_type::PROJECT,
                               .name = "Developer Experience",
                               .project_key = "DEVEX" };
  CHECK_FALSE(def.parent_identity().has_value());
}

TEST_CASE("entity_type: names and classification") {
  CHECK(entity_type_name(entity_type::STRATEGIC_OBJECTIVE) == "strategic_objective");
  CHECK(entity_type_display_name(entity_type::PORTFOLIO_EPIC) == "Portfolio Epic");
  CHECK(entity_type_display_name(entity_type::VERSION).empty());

  CHECK(entity_type_parse("feature") == entity_type::FEATURE);
  CHECK(entity_type_parse("Business Outcome") == entity_type::BUSINESS_OUTCOME);
  CHECK_FALSE(entity_type_parse("epic").has_value());

  CHECK(entity_type_is_issue(entity_type::CONSTRAINT));
  CHECK_FALSE(entity_type_is_issue(entity_type::PROJECT));
  CHECK(entity_type_is_governance(entity_type::PROJECT));
  CHECK_FALSE(entity_type_is_governance(entity_type::VERSION));

  CHECK(entity_type_hierarchy_parent(entity_type::STRATEGIC_OBJECTIVE) == entity_type::PROJECT);
  CHECK(entity_type_hierarchy_parent(entity_type::FEATURE) == entity_type::BUSINESS_OUTCOME);
  CHECK_FALSE(entity_type_hierarchy_parent(entity_type::CONSTRAINT).has_value());
}

}  // namespace rehearse
