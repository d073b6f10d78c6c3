#include "schema.h"

#include "errors.h"
#include "tui.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace rehearse {

namespace {

constexpr char kSelectType[]{ "com.atlassian.jira.plugin.system.customfieldtypes:select" };
constexpr char kTextareaType[]{ "com.atlassian.jira.plugin.system.customfieldtypes:textarea" };
constexpr char kTextSearcher[]{ "com.atlassian.jira.plugin.system.customfieldtypes:textsearcher" };

custom_field_spec trigger_field(char const *name, char const *description) {
  return { .name = name,
           .description = description,
           .type = kSelectType,
           .searcher = std::nullopt,
           .options = { "Yes", "No" } };
}

schema_outcome failed(std::string kind, std::string name, std::exception const &ex) {
  tui::error("Failed %s '%s': %s", kind.c_str(), name.c_str(), ex.what());
  return { .kind = std::move(kind),
           .name = std::move(name),
           .status = schema_status::FAILED,
           .id = {},
           .reason = ex.what() };
}

}  // namespace

std::vector<issue_type_spec> const &schema_issue_types() {
  static std::vector<issue_type_spec> const types{
    { "Constraint", "Governance constraint that blocks deployment until resolved", true },
    { "Strategic Objective", "", false },
    { "Portfolio Epic", "", false },
    { "Business Outcome", "", false },
    { "Feature", "", false },
    { "Story", "", false },
  };
  return types;
}

std::vector<custom_field_spec> const &schema_custom_fields() {
  static std::vector<custom_field_spec> const fields{
    { .name = "Risk Materiality",
      .description = "The materiality level of the risk",
      .type = kSelectType,
      .searcher = std::nullopt,
      .options = { "Low", "Medium", "High", "Critical" } },
    { .name = "Mitigation Plan",
      .description = "Description of how the risk will be mitigated",
      .type = kTextareaType,
      .searcher = kTextSearcher,
      .options = {} },
    { .name = "Guild",
      .description = "The responsible guild for this constraint",
      .type = kSelectType,
      .searcher = std::nullopt,
      .options = { "Security", "Data", "Operations", "Enterprise Architecture" } },
    trigger_field("Risk: External Boundary", "Story crosses an external trust boundary"),
    trigger_field("Risk: Sensitive Data", "Story touches sensitive or regulated data"),
    trigger_field("Risk: Security Controls", "Story changes authentication or security controls"),
    trigger_field("Risk: ML/AI Model Change", "Story changes an ML or AI model"),
    trigger_field("Risk: Critical Logic", "Story changes business-critical logic"),
  };
  return fields;
}

std::string_view schema_status_name(schema_status status) {
  switch (status) {
    case schema_status::CREATED: return "created";
    case schema_status::EXISTS: return "exists";
    case schema_status::MISSING: return "missing";
    case schema_status::FAILED: return "failed";
  }
  return "unknown";
}

std::vector<schema_outcome> schema_setup_issue_types(schema_admin &admin,
                                                     schema_options const &options) {
  std::vector<schema_outcome> out;
  for (auto const &spec : schema_issue_types()) {
    try {
      auto const id{ retry_call(options.retry, "find issue type " + spec.name, [&] {
        return admin.find_issue_type(spec.name);
      }) };
      schema_outcome outcome{ .kind = "issue type", .name = spec.name };

      if (id) {
        outcome.status = schema_status::EXISTS;
        outcome.id = *id;
      } else if (!spec.provisioned) {
        tui::warn("Issue type '%s' is missing; configure it in Jira admin", spec.name.c_str());
        outcome.status = schema_status::MISSING;
      } else if (options.dry_run) {
        tui::info("[DRY RUN] Would create issue type '%s'", spec.name.c_str());
        outcome.status = schema_status::CREATED;
      } else {
        outcome.id = retry_call(options.retry, "create issue type " + spec.name, [&] {
          return admin.create_issue_type(spec);
        });
        tui::info("Created issue type '%s' (%s)", spec.name.c_str(), outcome.id.c_str());
        outcome.status = schema_status::CREATED;
      }
      out.push_back(std::move(outcome));
    } catch (std::exception const &ex) { out.push_back(failed("issue type", spec.name, ex)); }
  }
  return out;
}

std::vector<schema_outcome> schema_setup_custom_fields(schema_admin &admin,
                                                       schema_options const &options) {
  std::vector<schema_outcome> out;
  for (auto const &spec : schema_custom_fields()) {
    try {
      auto const id{ retry_call(options.retry, "find field " + spec.name, [&] {
        return admin.find_custom_field(spec.name);
      }) };
      schema_outcome outcome{ .kind = "custom field", .name = spec.name };

      if (id) {
        outcome.status = schema_status::EXISTS;
        outcome.id = *id;
      } else if (options.dry_run) {
        tui::info("[DRY RUN] Would create custom field '%s'", spec.name.c_str());
        outcome.status = schema_status::CREATED;
      } else {
        outcome.id = retry_call(options.retry, "create field " + spec.name, [&] {
          return admin.create_custom_field(spec);
        });
        outcome.status = schema_status::CREATED;
        tui::info("Created custom field '%s' (%s)", spec.name.c_str(), outcome.id.c_str());

        try {
          retry_call(options.retry, "add " + outcome.id + " to default screen", [&] {
            admin.add_field_to_default_screen(outcome.id);
          });
        } catch (std::exception const &ex) {
          tui::warn("Could not add '%s' to the default screen: %s", spec.name.c_str(), ex.what());
        }
      }
      out.push_back(std::move(outcome));
    } catch (std::exception const &ex) { out.push_back(failed("custom field", spec.name, ex)); }
  }
  return out;
}

bool schema_ok(std::vector<schema_outcome> const &outcomes) {
  return std::ranges::none_of(outcomes, [](schema_outcome const &o) {
    return o.status == schema_status::FAILED;
  });
}

std::string schema_render_summary(std::vector<schema_outcome> const &outcomes) {
  std::string out;
  for (auto const &o : outcomes) {
    out += "  " + o.kind + " '" + o.name + "': " + std::string{ schema_status_name(o.status) };
    if (!o.id.empty()) { out += " (" + o.id + ")"; }
    if (!o.reason.empty()) { out += " - " + o.reason; }
    out += "\n";
  }

  bool header{ false };
  for (auto const &spec : schema_custom_fields()) {
    if (spec.options.empty()) { continue; }
    bool const touched{ std::ranges::any_of(outcomes, [&](schema_outcome const &o) {
      return o.kind == "custom field" && o.name == spec.name;
    }) };
    if (!touched) { continue; }
    if (!header) {
      out += "\n  Select options to configure in Jira admin:\n";
      header = true;
    }
    out += "    " + spec.name + ":";
    for (auto const &opt : spec.options) { out += " " + opt + ";"; }
    out.pop_back();
    out += "\n";
  }
  return out;
}

}  // namespace rehearse
