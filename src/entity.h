#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rehearse {

enum class entity_type {
  PROJECT,
  STRATEGIC_OBJECTIVE,
  PORTFOLIO_EPIC,
  BUSINESS_OUTCOME,
  FEATURE,
  CONSTRAINT,
  VERSION,
  FEATURE_VERSION,
  COMPONENT_MAPPING,
};

inline constexpr std::size_t kEntityTypeCount{ 9 };

// Stable lowercase token used in canonical identities and trace output.
std::string_view entity_type_name(entity_type type);

// Jira-facing name, e.g. "Portfolio Epic". Empty for non-issue types.
std::string_view entity_type_display_name(entity_type type);

std::optional<entity_type> entity_type_parse(std::string_view name);

// True for types stored as Jira issues (objective through constraint).
bool entity_type_is_issue(entity_type type);

// True for the governance structure that teardown discovers and deletes.
bool entity_type_is_governance(entity_type type);

// Parent type in the governance hierarchy: project for an objective, objective
// for an epic, and so on down to the feature. Empty for every other type.
std::optional<entity_type> entity_type_hierarchy_parent(entity_type type);

struct logical_identity {
  entity_type type;
  std::string name;         // Qualifying name: summary, project name, version name...
  std::string project_key;  // Owning project ("DEVEX")

  // "portfolio_epic:DEVEX/Build Golden Paths"
  std::string canonical() const;

  bool operator==(logical_identity const &other) const = default;
};

struct parent_ref {
  entity_type type;
  std::string name;

  bool operator==(parent_ref const &other) const = default;
};

using attribute_map_t = std::map<std::string, std::string>;

// Immutable description of one entity to provision. The parent, when present,
// lives in the same project as the child.
struct entity_definition {
  entity_type type;
  std::string name;
  std::string project_key;
  std::optional<parent_ref> parent;
  attribute_map_t attributes;

  logical_identity identity() const;
  std::optional<logical_identity> parent_identity() const;

  // Attribute value or empty string.
  std::string const &attribute(std::string const &key) const;
};

}  // namespace rehearse

template <>
struct std::hash<rehearse::logical_identity> {
  size_t operator()(rehearse::logical_identity const &id) const {
    return std::hash<std::string>{}(id.canonical());
  }
};
