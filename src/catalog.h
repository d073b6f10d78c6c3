#pragma once

#include "entity.h"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rehearse {

enum class phase {
  PROJECTS,
  ISSUE_TYPES,  // Instance-wide schema; no catalog entities
  FIELDS,
  HIERARCHY,
  CONSTRAINTS,
  VERSIONS,
  FEATURE_VERSIONS,
  COMPONENT_MAPPING,
};

std::string_view phase_name(phase p);

// Phase that provisions entities of the given type.
phase phase_of(entity_type type);

// Every phase in execution order.
std::vector<phase> all_phases();

// The complete built-in governance catalog in catalog order: projects, then the
// hierarchy depth-first, then constraints, versions and version assignments.
// Component mappings are not static; see component_mapping.h.
std::vector<entity_definition> const &catalog_builtin();

struct catalog_project {
  std::string key;
  std::string name;
};

std::vector<catalog_project> catalog_projects();

// Project identities, in catalog order, as used by teardown.
std::vector<logical_identity> catalog_project_identities();

struct catalog_selection {
  std::vector<entity_definition> entities;              // Entities of the selected phases
  std::unordered_set<logical_identity> pre_existing;  // Everything else in the catalog
};

// Split a catalog into the entities to provision and the identities assumed to
// already exist in the tracker.
catalog_selection catalog_select(std::vector<entity_definition> const &all,
                                 std::vector<phase> const &phases);

// Versions a feature may be assigned to, in round-robin order.
std::vector<std::string> const &catalog_unreleased_versions();

}  // namespace rehearse
