#pragma once

#include "retry.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

struct issue_type_spec {
  std::string name;
  std::string description;
  bool provisioned{ false };  // Created when missing; otherwise only verified
};

struct custom_field_spec {
  std::string name;
  std::string description;
  std::string type;                     // Jira custom field type key
  std::optional<std::string> searcher;  // Omitted for select fields; Jira picks one
  std::vector<std::string> options;     // Select options, configured by hand in Jira admin
};

// Constraint (provisioned) plus the Advanced Roadmaps hierarchy types, which
// must already be configured.
std::vector<issue_type_spec> const &schema_issue_types();

// Constraint fields, then the story risk trigger fields.
std::vector<custom_field_spec> const &schema_custom_fields();

// Instance-wide tracker administration, separate from per-project entities.
class schema_admin {
 public:
  virtual ~schema_admin() = default;

  // Ids, or empty when absent.
  virtual std::optional<std::string> find_issue_type(std::string const &name) = 0;
  virtual std::optional<std::string> find_custom_field(std::string const &name) = 0;

  virtual std::string create_issue_type(issue_type_spec const &spec) = 0;
  virtual std::string create_custom_field(custom_field_spec const &spec) = 0;

  // Add a field to the first tab of the instance's default screen.
  virtual void add_field_to_default_screen(std::string const &field_id) = 0;

 protected:
  schema_admin() = default;
};

enum class schema_status { CREATED, EXISTS, MISSING, FAILED };

std::string_view schema_status_name(schema_status status);

struct schema_outcome {
  std::string kind;  // "issue type" or "custom field"
  std::string name;
  schema_status status;
  std::string id;
  std::string reason;
};

struct schema_options {
  bool dry_run{ false };
  retry_policy retry{};
};

std::vector<schema_outcome> schema_setup_issue_types(schema_admin &admin,
                                                     schema_options const &options);

// New fields are also placed on the default screen; failing that is a warning.
std::vector<schema_outcome> schema_setup_custom_fields(schema_admin &admin,
                                                       schema_options const &options);

// Only FAILED counts; MISSING hierarchy types are reported as warnings.
bool schema_ok(std::vector<schema_outcome> const &outcomes);

// One line per outcome, then the select options to configure by hand.
std::string schema_render_summary(std::vector<schema_outcome> const &outcomes);

}  // namespace rehearse
