#pragma once

#include "http.h"
#include "schema.h"
#include "tracker_client.h"

#include <picojson.h>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

struct jira_settings {
  std::string base_url;
  std::string user;
  std::string token;  // Personal access token, sent as a bearer token
  bool verify_ssl{ true };
};

inline constexpr char kJiraParentLinkField[]{ "customfield_10108" };
inline constexpr char kJiraConstraintLinkType[]{ "Blocks" };
inline constexpr char kJiraMitigationPlanField[]{ "Mitigation Plan" };
inline constexpr char kJiraDefaultScreenId[]{ "1" };

// Jira Data Center REST v2 implementation of tracker_client and schema_admin.
class jira_client : public tracker_client, public schema_admin {
 public:
  jira_client(jira_settings settings, http_transport_t transport);

  std::optional<tracker_match> find_entity(logical_identity const &identity,
                                           std::optional<tracker_ref> const &parent) override;
  tracker_ref create_entity(entity_definition const &def,
                            std::optional<tracker_ref> const &parent) override;
  void delete_entity(tracker_ref const &ref) override;
  std::vector<tracker_entity> list_children(tracker_ref const &ref) override;
  void attach_field_to_screens(std::string_view field_id,
                               std::string_view project_key) override;
  std::string whoami() override;

  std::optional<std::string> find_issue_type(std::string const &name) override;
  std::optional<std::string> find_custom_field(std::string const &name) override;
  std::string create_issue_type(issue_type_spec const &spec) override;
  std::string create_custom_field(custom_field_spec const &spec) override;
  void add_field_to_default_screen(std::string const &field_id) override;

 private:
  struct response {
    long status;
    picojson::value body;  // Parsed JSON; null when the body was empty or not JSON
    std::string text;
  };

  // Sends the request and maps failures onto the error taxonomy. Statuses in
  // allowed are returned to the caller instead of thrown.
  response call(std::string const &method,
                std::string const &path,
                std::optional<picojson::value> const &body = std::nullopt,
                std::vector<long> const &allowed = {});

  std::optional<picojson::object> search_issue(std::string const &project_key,
                                               std::string const &summary,
                                               entity_type type);
  std::vector<picojson::object> search_all(std::string const &jql,
                                           std::vector<std::string> const &fields);

  std::optional<tracker_match> find_issue(logical_identity const &identity);
  std::optional<tracker_match> find_version(logical_identity const &identity);
  std::optional<tracker_match> find_feature_version(logical_identity const &identity,
                                                    std::optional<tracker_ref> const &parent);
  std::optional<tracker_match> find_component(logical_identity const &identity);
  std::optional<std::string> find_component_id(std::string const &project_key,
                                               std::string const &name);

  tracker_ref create_project(entity_definition const &def);
  tracker_ref create_issue(entity_definition const &def, std::optional<tracker_ref> const &parent);
  tracker_ref create_version(entity_definition const &def);
  tracker_ref assign_fix_version(entity_definition const &def, tracker_ref const &feature);
  tracker_ref map_component(entity_definition const &def, tracker_ref const &feature);

  void link_constraint(std::string const &constraint_key, std::string const &target_key);
  void transition_constraint(std::string const &issue_key, std::string const &status);
  std::optional<std::string> mitigation_field_id();

  // False when the screen has no tabs. A field already on the screen is not an error.
  bool add_field_to_screen(std::string const &screen_id, std::string_view field_id);

  std::vector<tracker_entity> linked_constraints(std::string const &issue_key);

  jira_settings settings_;
  http_transport_t transport_;

  std::mutex field_mutex_;
  std::optional<std::optional<std::string>> mitigation_field_;  // Outer: looked up yet
};

// Escape a value for use inside a double-quoted JQL string.
std::string jira_escape_jql(std::string_view value);

// Request body for POST /rest/api/2/issue.
picojson::value jira_issue_fields(entity_definition const &def,
                                  std::optional<tracker_ref> const &parent,
                                  std::optional<std::string> const &mitigation_field_id);

// Workflow transitions that move a new constraint from Identified to status.
std::vector<std::string> jira_constraint_transitions(std::string_view status);

}  // namespace rehearse
