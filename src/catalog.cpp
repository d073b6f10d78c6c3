#include "catalog.h"

#include "catalog_data.h"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

namespace rehearse {

namespace {

std::vector<entity_definition> build_catalog() {
  std::vector<entity_definition> out;
  std::map<std::string, std::string> project_names;

  for (auto const &p : catalog_data::projects()) {
    project_names[p.key] = p.name;
    out.push_back({ .type = entity_type::PROJECT,
                    .name = p.name,
                    .project_key = p.key,
                    .attributes = { { "description", p.description } } });
  }

  // Most recent summary per (project, type) while walking depth-first.
  std::map<std::pair<std::string, entity_type>, std::string> last_seen;
  std::map<std::string, std::vector<std::string>> features;

  for (auto const &row : catalog_data::hierarchy()) {
    std::string const key{ row.project_key };
    auto const parent_type{ *entity_type_hierarchy_parent(row.type) };

    std::string parent_name;
    if (parent_type == entity_type::PROJECT) {
      parent_name = project_names.at(key);
    } else if (auto it{ last_seen.find({ key, parent_type }) }; it != last_seen.end()) {
      parent_name = it->second;
    } else {
      throw std::logic_error("Catalog row without a preceding parent: " +
                             std::string{ row.summary });
    }

    out.push_back({ .type = row.type,
                    .name = row.summary,
                    .project_key = key,
                    .parent = parent_ref{ parent_type, std::move(parent_name) },
                    .attributes = { { "description", row.description } } });
    last_seen[{ key, row.type }] = row.summary;
    if (row.type == entity_type::FEATURE) { features[key].push_back(row.summary); }
  }

  for (auto const &row : catalog_data::constraints()) {
    out.push_back({ .type = entity_type::CONSTRAINT,
                    .name = row.summary,
                    .project_key = row.project_key,
                    .parent = parent_ref{ row.target_type, row.target_summary },
                    .attributes = { { "description", row.description },
                                    { "guild", row.guild },
                                    { "risk_materiality", row.materiality },
                                    { "mitigation_plan", row.mitigation },
                                    { "status", row.status } } });
  }

  for (auto const &p : catalog_data::projects()) {
    for (auto const &v : catalog_data::versions()) {
      out.push_back({ .type = entity_type::VERSION,
                      .name = v.name,
                      .project_key = p.key,
                      .parent = parent_ref{ entity_type::PROJECT, p.name },
                      .attributes = { { "description", v.description },
                                      { "released", v.released ? "true" : "false" } } });
    }
  }

  auto const &unreleased{ catalog_unreleased_versions() };
  for (auto const &p : catalog_data::projects()) {
    auto const &names{ features[p.key] };
    for (std::size_t i{ 0 }; i < names.size(); ++i) {
      out.push_back({ .type = entity_type::FEATURE_VERSION,
                      .name = names[i],
                      .project_key = p.key,
                      .parent = parent_ref{ entity_type::FEATURE, names[i] },
                      .attributes = { { "version", unreleased[i % unreleased.size()] } } });
    }
  }

  return out;
}

}  // namespace

std::string_view phase_name(phase p) {
  switch (p) {
    case phase::PROJECTS: return "projects";
    case phase::ISSUE_TYPES: return "issue-types";
    case phase::FIELDS: return "fields";
    case phase::HIERARCHY: return "hierarchy";
    case phase::CONSTRAINTS: return "constraints";
    case phase::VERSIONS: return "versions";
    case phase::FEATURE_VERSIONS: return "feature-versions";
    case phase::COMPONENT_MAPPING: return "component-mapping";
  }
  return "unknown";
}

phase phase_of(entity_type type) {
  switch (type) {
    case entity_type::PROJECT: return phase::PROJECTS;
    case entity_type::STRATEGIC_OBJECTIVE:
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
    case entity_type::FEATURE: return phase::HIERARCHY;
    case entity_type::CONSTRAINT: return phase::CONSTRAINTS;
    case entity_type::VERSION: return phase::VERSIONS;
    case entity_type::FEATURE_VERSION: return phase::FEATURE_VERSIONS;
    case entity_type::COMPONENT_MAPPING: return phase::COMPONENT_MAPPING;
  }
  throw std::logic_error("phase_of: unknown entity type");
}

std::vector<phase> all_phases() {
  return { phase::PROJECTS,    phase::ISSUE_TYPES,      phase::FIELDS,
           phase::HIERARCHY,   phase::CONSTRAINTS,      phase::VERSIONS,
           phase::FEATURE_VERSIONS, phase::COMPONENT_MAPPING };
}

std::vector<entity_definition> const &catalog_builtin() {
  static std::vector<entity_definition> const catalog{ build_catalog() };
  return catalog;
}

std::vector<catalog_project> catalog_projects() {
  std::vector<catalog_project> out;
  for (auto const &p : catalog_data::projects()) { out.push_back({ p.key, p.name }); }
  return out;
}

std::vector<logical_identity> catalog_project_identities() {
  std::vector<logical_identity> out;
  for (auto const &p : catalog_data::projects()) {
    out.push_back({ .type = entity_type::PROJECT, .name = p.name, .project_key = p.key });
  }
  return out;
}

catalog_selection catalog_select(std::vector<entity_definition> const &all,
                                 std::vector<phase> const &phases) {
  catalog_selection sel;
  for (auto const &def : all) {
    if (std::ranges::find(phases, phase_of(def.type)) != phases.end()) {
      sel.entities.push_back(def);
    } else {
      sel.pre_existing.insert(def.identity());
    }
  }
  return sel;
}

std::vector<std::string> const &catalog_unreleased_versions() {
  static std::vector<std::string> const versions{ [] {
    std::vector<std::string> v;
    for (auto const &row : catalog_data::versions()) {
      if (!row.released) { v.emplace_back(row.name); }
    }
    return v;
  }() };
  return versions;
}

}  // namespace rehearse
