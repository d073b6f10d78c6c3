#include "entity.h"

#include <array>

namespace rehearse {

namespace {

struct type_info {
  entity_type type;
  std::string_view name;
  std::string_view display_name;
};

constexpr std::array<type_info, kEntityTypeCount> kTypeInfo{ {
    { entity_type::PROJECT, "project", "" },
    { entity_type::STRATEGIC_OBJECTIVE, "strategic_objective", "Strategic Objective" },
    { entity_type::PORTFOLIO_EPIC, "portfolio_epic", "Portfolio Epic" },
    { entity_type::BUSINESS_OUTCOME, "business_outcome", "Business Outcome" },
    { entity_type::FEATURE, "feature", "Feature" },
    { entity_type::CONSTRAINT, "constraint", "Constraint" },
    { entity_type::VERSION, "version", "" },
    { entity_type::FEATURE_VERSION, "feature_version", "" },
    { entity_type::COMPONENT_MAPPING, "component_mapping", "" },
} };

std::string const kEmptyAttribute;

}  // namespace

std::string_view entity_type_name(entity_type type) {
  return kTypeInfo[static_cast<std::size_t>(type)].name;
}

std::string_view entity_type_display_name(entity_type type) {
  return kTypeInfo[static_cast<std::size_t>(type)].display_name;
}

std::optional<entity_type> entity_type_parse(std::string_view name) {
  for (auto const &info : kTypeInfo) {
    if (info.name == name || (!info.display_name.empty() && info.display_name == name)) {
      return info.type;
    }
  }
  return std::nullopt;
}

bool entity_type_is_issue(entity_type type) {
  switch (type) {
    case entity_type::STRATEGIC_OBJECTIVE:
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
    case entity_type::FEATURE:
    case entity_type::CONSTRAINT: return true;
    default: return false;
  }
}

bool entity_type_is_governance(entity_type type) {
  return type == entity_type::PROJECT || entity_type_is_issue(type);
}

std::optional<entity_type> entity_type_hierarchy_parent(entity_type type) {
  switch (type) {
    case entity_type::STRATEGIC_OBJECTIVE: return entity_type::PROJECT;
    case entity_type::PORTFOLIO_EPIC: return entity_type::STRATEGIC_OBJECTIVE;
    case entity_type::BUSINESS_OUTCOME: return entity_type::PORTFOLIO_EPIC;
    case entity_type::FEATURE: return entity_type::BUSINESS_OUTCOME;
    default: return std::nullopt;
  }
}

std::string logical_identity::canonical() const {
  std::string result{ entity_type_name(type) };
  result.reserve(result.size() + project_key.size() + name.size() + 2);
  result += ':';
  result += project_key;
  result += '/';
  result += name;
  return result;
}

logical_identity entity_definition::identity() const {
  return logical_identity{ .type = type, .name = name, .project_key = project_key };
}

std::optional<logical_identity> entity_definition::parent_identity() const {
  if (!parent) { return std::nullopt; }
  return logical_identity{ .type = parent->type,
                           .name = parent->name,
                           .project_key = project_key };
}

std::string const &entity_definition::attribute(std::string const &key) const {
  auto const it{ attributes.find(key) };
  return it == attributes.end() ? kEmptyAttribute : it->second;
}

}  // namespace rehearse
