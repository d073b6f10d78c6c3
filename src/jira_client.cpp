#include "jira_client.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace rehearse {

namespace {

constexpr int kSearchPageSize{ 100 };
constexpr std::size_t kErrorBodyChars{ 300 };

picojson::object const *object_at(picojson::object const &obj, std::string const &key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<picojson::object>()) { return nullptr; }
  return &it->second.get<picojson::object>();
}

picojson::array const *array_at(picojson::object const &obj, std::string const &key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<picojson::array>()) { return nullptr; }
  return &it->second.get<picojson::array>();
}

// Jira returns ids as strings ("10001") on most endpoints and as numbers on a few.
std::string id_string(picojson::value const &v) {
  if (v.is<std::string>()) { return v.get<std::string>(); }
  if (v.is<double>()) { return std::to_string(std::llround(v.get<double>())); }
  return {};
}

std::string string_at(picojson::object const &obj, std::string const &key) {
  auto const it{ obj.find(key) };
  if (it == obj.end()) { return {}; }
  return id_string(it->second);
}

picojson::object const &issue_fields(picojson::object const &issue) {
  static picojson::object const empty;
  auto const *fields{ object_at(issue, "fields") };
  return fields ? *fields : empty;
}

std::optional<entity_type> issue_type_of(picojson::object const &issue) {
  auto const *type{ object_at(issue_fields(issue), "issuetype") };
  if (!type) { return std::nullopt; }
  auto const parsed{ entity_type_parse(string_at(*type, "name")) };
  if (!parsed || !entity_type_is_issue(*parsed)) { return std::nullopt; }
  return parsed;
}

// Parent Link comes back as a bare key or, on newer servers, as an object.
std::optional<std::string> parent_link_key(picojson::object const &fields) {
  auto const it{ fields.find(kJiraParentLinkField) };
  if (it == fields.end()) { return std::nullopt; }
  if (it->second.is<std::string>() && !it->second.get<std::string>().empty()) {
    return it->second.get<std::string>();
  }
  if (it->second.is<picojson::object>()) {
    auto const &obj{ it->second.get<picojson::object>() };
    if (auto key{ string_at(obj, "key") }; !key.empty()) { return key; }
    if (auto const *data{ object_at(obj, "data") }) {
      if (auto key{ string_at(*data, "key") }; !key.empty()) { return key; }
    }
  }
  return std::nullopt;
}

// The other side of each "Blocks" link on an issue, in either direction.
std::vector<picojson::object> blocks_links(picojson::object const &fields) {
  std::vector<picojson::object> out;
  auto const *links{ array_at(fields, "issuelinks") };
  if (!links) { return out; }
  for (auto const &link : *links) {
    if (!link.is<picojson::object>()) { continue; }
    auto const &l{ link.get<picojson::object>() };
    auto const *type{ object_at(l, "type") };
    if (!type || string_at(*type, "name") != kJiraConstraintLinkType) { continue; }
    if (auto const *other{ object_at(l, "outwardIssue") }) { out.push_back(*other); }
    if (auto const *other{ object_at(l, "inwardIssue") }) { out.push_back(*other); }
  }
  return out;
}

picojson::value key_object(std::string const &key) {
  picojson::object obj;
  obj["key"] = picojson::value(key);
  return picojson::value(obj);
}

picojson::value name_object(std::string const &name) {
  picojson::object obj;
  obj["name"] = picojson::value(name);
  return picojson::value(obj);
}

picojson::value fields_body(picojson::object fields) {
  picojson::object body;
  body["fields"] = picojson::value(std::move(fields));
  return picojson::value(body);
}

// Every issue type teardown owns, as a JQL list.
std::string governance_issue_types_jql() {
  std::string out;
  for (auto const type : { entity_type::STRATEGIC_OBJECTIVE,
                           entity_type::PORTFOLIO_EPIC,
                           entity_type::BUSINESS_OUTCOME,
                           entity_type::FEATURE,
                           entity_type::CONSTRAINT }) {
    if (!out.empty()) { out += ", "; }
    out += "\"" + std::string{ entity_type_display_name(type) } + "\"";
  }
  return out;
}

}  // namespace

std::string jira_escape_jql(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char const c : value) {
    if (c == '"' || c == '\\') { out.push_back('\\'); }
    out.push_back(c);
  }
  return out;
}

picojson::value jira_issue_fields(entity_definition const &def,
                                  std::optional<tracker_ref> const &parent,
                                  std::optional<std::string> const &mitigation_field_id) {
  picojson::object fields;
  fields["project"] = key_object(def.project_key);
  fields["issuetype"] = name_object(std::string{ entity_type_display_name(def.type) });
  fields["summary"] = picojson::value(def.name);

  std::string description{ def.attribute("description") };

  switch (def.type) {
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
    case entity_type::FEATURE:
      // Advanced Roadmaps hierarchy; the standard "parent" field is for sub-tasks.
      if (parent) { fields[kJiraParentLinkField] = picojson::value(parent->id); }
      break;

    case entity_type::CONSTRAINT:
      // Guild and materiality are select fields that need configured options,
      // so they ride along in the description.
      if (auto const &guild{ def.attribute("guild") }; !guild.empty()) {
        description += "\n\nGuild: " + guild;
      }
      if (auto const &materiality{ def.attribute("risk_materiality") }; !materiality.empty()) {
        description += "\nRisk Materiality: " + materiality;
      }
      if (mitigation_field_id && !def.attribute("mitigation_plan").empty()) {
        fields[*mitigation_field_id] = picojson::value(def.attribute("mitigation_plan"));
      }
      break;

    default: break;
  }

  if (!description.empty()) { fields["description"] = picojson::value(description); }
  return fields_body(std::move(fields));
}

std::vector<std::string> jira_constraint_transitions(std::string_view status) {
  if (status == "In Progress") { return { "Start Work" }; }
  if (status == "Ready for Review") { return { "Start Work", "Submit for Review" }; }
  if (status == "Closed") { return { "Start Work", "Submit for Review", "Approve & Close" }; }
  return {};
}

jira_client::jira_client(jira_settings settings, http_transport_t transport)
    : settings_{ std::move(settings) }, transport_{ std::move(transport) } {
  while (!settings_.base_url.empty() && settings_.base_url.back() == '/') {
    settings_.base_url.pop_back();
  }
}

jira_client::response jira_client::call(std::string const &method,
                                        std::string const &path,
                                        std::optional<picojson::value> const &body,
                                        std::vector<long> const &allowed) {
  http_request request{ .method = method,
                        .url = settings_.base_url + path,
                        .headers = { { "Authorization", "Bearer " + settings_.token },
                                     { "Accept", "application/json" } } };
  if (body) {
    request.headers.emplace_back("Content-Type", "application/json");
    request.body = body->serialize();
  }

  auto const res{ transport_(request) };
  bool const ok{ res.status >= 200 && res.status < 300 };
  std::string const what{ method + " " + path };

  if (!ok && std::ranges::find(allowed, res.status) == allowed.end()) {
    auto const detail{ what + " returned " + std::to_string(res.status) + ": " +
                       util_ellipsize(res.body, kErrorBodyChars) };
    if (res.status == 429) { throw rate_limit_error(detail, res.retry_after); }
    if (res.status >= 500 || res.status < 100) { throw transport_error(detail); }
    throw validation_error(detail);
  }

  response out{ .status = res.status, .body = {}, .text = res.body };
  if (!res.body.empty()) {
    std::string const err{ picojson::parse(out.body, res.body) };
    if (!err.empty()) {
      if (ok) { throw transport_error(what + ": malformed JSON response: " + err); }
      out.body = picojson::value{};
    }
  }
  return out;
}

std::vector<picojson::object> jira_client::search_all(std::string const &jql,
                                                      std::vector<std::string> const &fields) {
  picojson::array field_list;
  for (auto const &f : fields) { field_list.emplace_back(f); }

  std::vector<picojson::object> issues;
  for (int start_at{ 0 };;) {
    picojson::object payload;
    payload["jql"] = picojson::value(jql);
    payload["fields"] = picojson::value(field_list);
    payload["startAt"] = picojson::value(static_cast<double>(start_at));
    payload["maxResults"] = picojson::value(static_cast<double>(kSearchPageSize));

    auto const res{ call("POST", "/rest/api/2/search", picojson::value(payload)) };
    if (!res.body.is<picojson::object>()) { break; }
    auto const &obj{ res.body.get<picojson::object>() };

    auto const *page{ array_at(obj, "issues") };
    if (!page || page->empty()) { break; }
    for (auto const &issue : *page) {
      if (issue.is<picojson::object>()) { issues.push_back(issue.get<picojson::object>()); }
    }

    start_at += static_cast<int>(page->size());
    auto const total_it{ obj.find("total") };
    if (total_it == obj.end() || !total_it->second.is<double>() ||
        start_at >= static_cast<int>(total_it->second.get<double>())) {
      break;
    }
  }
  return issues;
}

std::optional<picojson::object> jira_client::search_issue(std::string const &project_key,
                                                          std::string const &summary,
                                                          entity_type type) {
  std::string const jql{ "project = " + project_key + " AND summary ~ \"" +
                         jira_escape_jql(summary) + "\" AND issuetype = \"" +
                         std::string{ entity_type_display_name(type) } + "\"" };

  // Text search is fuzzy; keep only the exact summary.
  for (auto &issue : search_all(jql, { "summary", "issuetype", kJiraParentLinkField, "issuelinks" })) {
    if (string_at(issue_fields(issue), "summary") == summary) { return std::move(issue); }
  }
  return std::nullopt;
}

std::optional<tracker_match> jira_client::find_entity(logical_identity const &identity,
                                                      std::optional<tracker_ref> const &parent) {
  switch (identity.type) {
    case entity_type::PROJECT: {
      auto const res{ call("GET", "/rest/api/2/project/" + identity.project_key, {}, { 404 }) };
      if (res.status == 404) { return std::nullopt; }
      return tracker_match{ .ref = { entity_type::PROJECT, identity.project_key } };
    }
    case entity_type::STRATEGIC_OBJECTIVE:
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
    case entity_type::FEATURE:
    case entity_type::CONSTRAINT: return find_issue(identity);
    case entity_type::VERSION: return find_version(identity);
    case entity_type::FEATURE_VERSION: return find_feature_version(identity, parent);
    case entity_type::COMPONENT_MAPPING: return find_component(identity);
  }
  return std::nullopt;
}

std::optional<tracker_match> jira_client::find_issue(logical_identity const &identity) {
  auto const issue{ search_issue(identity.project_key, identity.name, identity.type) };
  if (!issue) { return std::nullopt; }

  tracker_match match{ .ref = { identity.type, string_at(*issue, "key") } };
  auto const &fields{ issue_fields(*issue) };

  if (identity.type == entity_type::STRATEGIC_OBJECTIVE) {
    match.parent = tracker_ref{ entity_type::PROJECT, identity.project_key };
  } else if (identity.type == entity_type::CONSTRAINT) {
    for (auto const &target : blocks_links(fields)) {
      if (auto const type{ issue_type_of(target) }) {
        match.parent = tracker_ref{ *type, string_at(target, "key") };
        break;
      }
    }
  } else if (auto const key{ parent_link_key(fields) }) {
    match.parent = tracker_ref{ *entity_type_hierarchy_parent(identity.type), *key };
  }
  return match;
}

std::optional<tracker_match> jira_client::find_version(logical_identity const &identity) {
  auto const res{
    call("GET", "/rest/api/2/project/" + identity.project_key + "/versions", {}, { 404 })
  };
  if (res.status == 404 || !res.body.is<picojson::array>()) { return std::nullopt; }

  for (auto const &v : res.body.get<picojson::array>()) {
    if (!v.is<picojson::object>()) { continue; }
    auto const &obj{ v.get<picojson::object>() };
    if (string_at(obj, "name") == identity.name) {
      return tracker_match{ .ref = { entity_type::VERSION, string_at(obj, "id") },
                            .parent = tracker_ref{ entity_type::PROJECT, identity.project_key } };
    }
  }
  return std::nullopt;
}

// A feature counts as assigned once it carries any fix version.
std::optional<tracker_match> jira_client::find_feature_version(
    logical_identity const &identity,
    std::optional<tracker_ref> const &parent) {
  std::string feature_key;
  if (parent) {
    feature_key = parent->id;
  } else if (auto const feature{
                 search_issue(identity.project_key, identity.name, entity_type::FEATURE) }) {
    feature_key = string_at(*feature, "key");
  } else {
    return std::nullopt;
  }

  auto const res{ call("GET", "/rest/api/2/issue/" + feature_key + "?fields=fixVersions", {}, { 404 }) };
  if (res.status == 404 || !res.body.is<picojson::object>()) { return std::nullopt; }

  auto const *versions{ array_at(issue_fields(res.body.get<picojson::object>()), "fixVersions") };
  if (!versions || versions->empty()) { return std::nullopt; }
  return tracker_match{ .ref = { entity_type::FEATURE_VERSION, feature_key },
                        .parent = tracker_ref{ entity_type::FEATURE, feature_key } };
}

std::optional<std::string> jira_client::find_component_id(std::string const &project_key,
                                                          std::string const &name) {
  auto const res{ call("GET", "/rest/api/2/project/" + project_key + "/components", {}, { 404 }) };
  if (res.status == 404 || !res.body.is<picojson::array>()) { return std::nullopt; }

  for (auto const &c : res.body.get<picojson::array>()) {
    if (c.is<picojson::object>() && string_at(c.get<picojson::object>(), "name") == name) {
      return string_at(c.get<picojson::object>(), "id");
    }
  }
  return std::nullopt;
}

// A mapping exists once its component is attached to a feature; a bare
// component is reused by create_entity.
std::optional<tracker_match> jira_client::find_component(logical_identity const &identity) {
  auto const component_id{ find_component_id(identity.project_key, identity.name) };
  if (!component_id) { return std::nullopt; }

  auto const issues{ search_all("project = " + identity.project_key + " AND component = " +
                                    *component_id + " AND issuetype = \"Feature\"",
                                { "summary", "issuetype" }) };
  if (issues.empty()) { return std::nullopt; }

  return tracker_match{ .ref = { entity_type::COMPONENT_MAPPING, *component_id },
                        .parent = tracker_ref{ entity_type::FEATURE,
                                               string_at(issues.front(), "key") } };
}

tracker_ref jira_client::create_entity(entity_definition const &def,
                                       std::optional<tracker_ref> const &parent) {
  switch (def.type) {
    case entity_type::PROJECT: return create_project(def);
    case entity_type::STRATEGIC_OBJECTIVE:
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
    case entity_type::FEATURE:
    case entity_type::CONSTRAINT: return create_issue(def, parent);
    case entity_type::VERSION: return create_version(def);
    case entity_type::FEATURE_VERSION:
    case entity_type::COMPONENT_MAPPING:
      if (!parent) {
        throw validation_error(def.identity().canonical() + " requires a resolved feature");
      }
      return def.type == entity_type::FEATURE_VERSION ? assign_fix_version(def, *parent)
                                                      : map_component(def, *parent);
  }
  throw validation_error("Unsupported entity type for " + def.identity().canonical());
}

tracker_ref jira_client::create_project(entity_definition const &def) {
  picojson::object payload;
  payload["key"] = picojson::value(def.project_key);
  payload["name"] = picojson::value(def.name);
  payload["projectTypeKey"] = picojson::value(std::string{ "software" });
  payload["lead"] = picojson::value(settings_.user);
  if (auto const &desc{ def.attribute("description") }; !desc.empty()) {
    payload["description"] = picojson::value(desc);
  }

  tui::debug("Creating project %s - %s", def.project_key.c_str(), def.name.c_str());
  call("POST", "/rest/api/2/project", picojson::value(payload));
  return { entity_type::PROJECT, def.project_key };
}

tracker_ref jira_client::create_issue(entity_definition const &def,
                                      std::optional<tracker_ref> const &parent) {
  std::optional<std::string> mitigation;
  if (def.type == entity_type::CONSTRAINT) { mitigation = mitigation_field_id(); }

  auto const res{ call("POST", "/rest/api/2/issue", jira_issue_fields(def, parent, mitigation)) };
  std::string key;
  if (res.body.is<picojson::object>()) { key = string_at(res.body.get<picojson::object>(), "key"); }
  if (key.empty()) {
    throw transport_error("Issue create for " + def.identity().canonical() +
                          " returned no key");
  }

  // The issue exists from here on; follow-up failures are warnings so that a
  // retry never creates a second copy.
  if (def.type == entity_type::CONSTRAINT) {
    if (parent) { link_constraint(key, parent->id); }
    transition_constraint(key, def.attribute("status"));
  }
  return { def.type, key };
}

tracker_ref jira_client::create_version(entity_definition const &def) {
  picojson::object payload;
  payload["project"] = picojson::value(def.project_key);
  payload["name"] = picojson::value(def.name);
  payload["released"] = picojson::value(def.attribute("released") == "true");
  if (auto const &desc{ def.attribute("description") }; !desc.empty()) {
    payload["description"] = picojson::value(desc);
  }
  if (auto const &start{ def.attribute("start_date") }; !start.empty()) {
    payload["startDate"] = picojson::value(start);
  }
  if (auto const &release{ def.attribute("release_date") }; !release.empty()) {
    payload["releaseDate"] = picojson::value(release);
  }

  auto const res{ call("POST", "/rest/api/2/version", picojson::value(payload)) };
  std::string id;
  if (res.body.is<picojson::object>()) { id = string_at(res.body.get<picojson::object>(), "id"); }
  if (id.empty()) {
    throw transport_error("Version create for " + def.identity().canonical() + " returned no id");
  }
  return { entity_type::VERSION, id };
}

tracker_ref jira_client::assign_fix_version(entity_definition const &def,
                                            tracker_ref const &feature) {
  auto const &version{ def.attribute("version") };
  if (version.empty()) {
    throw validation_error(def.identity().canonical() + " names no version");
  }

  picojson::array versions;
  versions.push_back(name_object(version));
  picojson::object fields;
  fields["fixVersions"] = picojson::value(versions);

  call("PUT", "/rest/api/2/issue/" + feature.id, fields_body(std::move(fields)));
  return { entity_type::FEATURE_VERSION, feature.id };
}

tracker_ref jira_client::map_component(entity_definition const &def, tracker_ref const &feature) {
  auto component_id{ find_component_id(def.project_key, def.name) };
  if (!component_id) {
    picojson::object payload;
    payload["name"] = picojson::value(def.name);
    payload["project"] = picojson::value(def.project_key);
    if (auto const &desc{ def.attribute("description") }; !desc.empty()) {
      payload["description"] = picojson::value(desc);
    }
    auto const res{ call("POST", "/rest/api/2/component", picojson::value(payload)) };
    if (res.body.is<picojson::object>()) {
      component_id = string_at(res.body.get<picojson::object>(), "id");
    }
    if (!component_id || component_id->empty()) {
      throw transport_error("Component create for " + def.identity().canonical() +
                            " returned no id");
    }
  }

  picojson::object id_obj;
  id_obj["id"] = picojson::value(*component_id);
  picojson::object add;
  add["add"] = picojson::value(id_obj);
  picojson::array ops;
  ops.emplace_back(add);
  picojson::object update;
  update["components"] = picojson::value(ops);
  picojson::object body;
  body["update"] = picojson::value(update);

  call("PUT", "/rest/api/2/issue/" + feature.id, picojson::value(body));
  return { entity_type::COMPONENT_MAPPING, *component_id };
}

void jira_client::link_constraint(std::string const &constraint_key,
                                  std::string const &target_key) {
  picojson::object payload;
  payload["type"] = name_object(kJiraConstraintLinkType);
  payload["inwardIssue"] = key_object(target_key);
  payload["outwardIssue"] = key_object(constraint_key);

  try {
    call("POST", "/rest/api/2/issueLink", picojson::value(payload));
    tui::debug("Linked %s blocks %s", constraint_key.c_str(), target_key.c_str());
  } catch (rehearse_error const &ex) {
    tui::warn("Failed to link %s -> %s: %s", constraint_key.c_str(), target_key.c_str(), ex.what());
  }
}

void jira_client::transition_constraint(std::string const &issue_key, std::string const &status) {
  std::string const path{ "/rest/api/2/issue/" + issue_key + "/transitions" };

  for (auto const &name : jira_constraint_transitions(status)) {
    try {
      auto const res{ call("GET", path) };
      std::string transition_id;
      if (res.body.is<picojson::object>()) {
        if (auto const *list{ array_at(res.body.get<picojson::object>(), "transitions") }) {
          for (auto const &t : *list) {
            if (t.is<picojson::object>() && string_at(t.get<picojson::object>(), "name") == name) {
              transition_id = string_at(t.get<picojson::object>(), "id");
              break;
            }
          }
        }
      }
      if (transition_id.empty()) {
        tui::warn("Transition '%s' not available for %s", name.c_str(), issue_key.c_str());
        return;
      }

      picojson::object id_obj;
      id_obj["id"] = picojson::value(transition_id);
      picojson::object payload;
      payload["transition"] = picojson::value(id_obj);
      call("POST", path, picojson::value(payload));
      tui::debug("Transitioned %s via '%s'", issue_key.c_str(), name.c_str());
    } catch (rehearse_error const &ex) {
      tui::warn("Failed to transition %s via '%s': %s", issue_key.c_str(), name.c_str(), ex.what());
      return;
    }
  }
}

std::optional<std::string> jira_client::mitigation_field_id() {
  std::lock_guard const lock{ field_mutex_ };
  if (mitigation_field_) { return *mitigation_field_; }

  auto found{ find_custom_field(kJiraMitigationPlanField) };
  if (!found) { tui::warn("Custom field '%s' not found; constraints created without it", kJiraMitigationPlanField); }

  mitigation_field_ = found;
  return found;
}

std::optional<std::string> jira_client::find_issue_type(std::string const &name) {
  auto const res{ call("GET", "/rest/api/2/issuetype") };
  if (!res.body.is<picojson::array>()) { return std::nullopt; }
  for (auto const &t : res.body.get<picojson::array>()) {
    if (t.is<picojson::object>() && string_at(t.get<picojson::object>(), "name") == name) {
      return string_at(t.get<picojson::object>(), "id");
    }
  }
  return std::nullopt;
}

std::string jira_client::create_issue_type(issue_type_spec const &spec) {
  picojson::object payload;
  payload["name"] = picojson::value(spec.name);
  payload["description"] = picojson::value(spec.description);
  payload["type"] = picojson::value(std::string{ "standard" });

  auto const res{ call("POST", "/rest/api/2/issuetype", picojson::value(payload)) };
  if (!res.body.is<picojson::object>()) {
    throw transport_error("Unexpected response creating issue type " + spec.name);
  }
  return string_at(res.body.get<picojson::object>(), "id");
}

std::optional<std::string> jira_client::find_custom_field(std::string const &name) {
  auto const res{ call("GET", "/rest/api/2/field") };
  if (!res.body.is<picojson::array>()) { return std::nullopt; }
  for (auto const &f : res.body.get<picojson::array>()) {
    if (!f.is<picojson::object>()) { continue; }
    auto const &field{ f.get<picojson::object>() };
    auto const custom{ field.find("custom") };
    bool const is_custom{ custom != field.end() && custom->second.is<bool>() &&
                          custom->second.get<bool>() };
    if (is_custom && string_at(field, "name") == name) { return string_at(field, "id"); }
  }
  return std::nullopt;
}

std::string jira_client::create_custom_field(custom_field_spec const &spec) {
  picojson::object payload;
  payload["name"] = picojson::value(spec.name);
  payload["description"] = picojson::value(spec.description);
  payload["type"] = picojson::value(spec.type);
  if (spec.searcher) { payload["searcherKey"] = picojson::value(*spec.searcher); }

  auto const res{ call("POST", "/rest/api/2/field", picojson::value(payload)) };
  if (!res.body.is<picojson::object>()) {
    throw transport_error("Unexpected response creating field " + spec.name);
  }
  return string_at(res.body.get<picojson::object>(), "id");
}

void jira_client::add_field_to_default_screen(std::string const &field_id) {
  if (!add_field_to_screen(kJiraDefaultScreenId, field_id)) {
    throw validation_error(std::string{ "Default screen " } + kJiraDefaultScreenId + " has no tabs");
  }
}

bool jira_client::add_field_to_screen(std::string const &screen_id, std::string_view field_id) {
  auto const tabs{ call("GET", "/rest/api/2/screens/" + screen_id + "/tabs") };
  if (!tabs.body.is<picojson::array>() || tabs.body.get<picojson::array>().empty() ||
      !tabs.body.get<picojson::array>().front().is<picojson::object>()) {
    return false;
  }
  auto const tab_id{ string_at(tabs.body.get<picojson::array>().front().get<picojson::object>(), "id") };

  picojson::object payload;
  payload["fieldId"] = picojson::value(std::string{ field_id });
  auto const added{ call("POST",
                         "/rest/api/2/screens/" + screen_id + "/tabs/" + tab_id + "/fields",
                         picojson::value(payload),
                         { 400 }) };
  if (added.status == 400) {
    if (util_to_lower(added.text).find("already") == std::string::npos) {
      throw validation_error("Adding " + std::string{ field_id } + " to screen " + screen_id +
                             " failed: " + util_ellipsize(added.text, kErrorBodyChars));
    }
    tui::debug("Field %.*s already on screen %s",
               static_cast<int>(field_id.size()),
               field_id.data(),
               screen_id.c_str());
  }
  return true;
}

void jira_client::delete_entity(tracker_ref const &ref) {
  std::string path;
  switch (ref.type) {
    case entity_type::PROJECT: path = "/rest/api/2/project/" + ref.id; break;
    case entity_type::STRATEGIC_OBJECTIVE:
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
    case entity_type::FEATURE:
    case entity_type::CONSTRAINT: path = "/rest/api/2/issue/" + ref.id; break;
    case entity_type::VERSION: path = "/rest/api/2/version/" + ref.id; break;
    case entity_type::COMPONENT_MAPPING: path = "/rest/api/2/component/" + ref.id; break;
    case entity_type::FEATURE_VERSION: {
      picojson::object fields;
      fields["fixVersions"] = picojson::value(picojson::array{});
      call("PUT", "/rest/api/2/issue/" + ref.id, fields_body(std::move(fields)));
      return;
    }
  }

  auto const res{ call("DELETE", path, {}, { 404 }) };
  if (res.status == 404) { tui::debug("%s already gone", path.c_str()); }
}

std::vector<tracker_entity> jira_client::linked_constraints(std::string const &issue_key) {
  std::vector<tracker_entity> out;
  auto const res{ call("GET", "/rest/api/2/issue/" + issue_key + "?fields=issuelinks", {}, { 404 }) };
  if (res.status == 404 || !res.body.is<picojson::object>()) { return out; }

  for (auto const &other : blocks_links(issue_fields(res.body.get<picojson::object>()))) {
    if (issue_type_of(other) == entity_type::CONSTRAINT) {
      out.push_back({ .ref = { entity_type::CONSTRAINT, string_at(other, "key") },
                      .name = string_at(issue_fields(other), "summary") });
    }
  }
  return out;
}

std::vector<tracker_entity> jira_client::list_children(tracker_ref const &ref) {
  std::vector<picojson::object> issues;
  switch (ref.type) {
    case entity_type::PROJECT:
      // Every governance issue, so orphans without a parent link go too.
      issues = search_all(
          "project = " + ref.id + " AND issuetype in (" + governance_issue_types_jql() + ")",
          { "summary", "issuetype" });
      break;
    case entity_type::STRATEGIC_OBJECTIVE:
    case entity_type::PORTFOLIO_EPIC:
    case entity_type::BUSINESS_OUTCOME:
      issues = search_all("\"Parent Link\" = " + ref.id, { "summary", "issuetype" });
      break;
    default: break;
  }

  std::vector<tracker_entity> out;
  std::set<std::string> seen;
  for (auto const &issue : issues) {
    auto const type{ issue_type_of(issue) };
    auto const key{ string_at(issue, "key") };
    if (!type || key.empty() || !seen.insert(key).second) { continue; }
    out.push_back({ .ref = { *type, key }, .name = string_at(issue_fields(issue), "summary") });
  }

  if (ref.type == entity_type::BUSINESS_OUTCOME || ref.type == entity_type::FEATURE) {
    for (auto &c : linked_constraints(ref.id)) {
      if (seen.insert(c.ref.id).second) { out.push_back(std::move(c)); }
    }
  }
  return out;
}

void jira_client::attach_field_to_screens(std::string_view field_id,
                                          std::string_view project_key) {
  auto const res{ call("GET", "/rest/api/2/screens") };

  // Older servers return a bare array, newer ones a page object.
  picojson::array const *screens{ nullptr };
  if (res.body.is<picojson::array>()) {
    screens = &res.body.get<picojson::array>();
  } else if (res.body.is<picojson::object>()) {
    screens = array_at(res.body.get<picojson::object>(), "values");
  }

  std::string const prefix{ std::string{ project_key } + ":" };
  std::size_t matched{ 0 };
  for (auto const &s : screens ? *screens : picojson::array{}) {
    if (!s.is<picojson::object>()) { continue; }
    auto const &screen{ s.get<picojson::object>() };
    if (!string_at(screen, "name").starts_with(prefix)) { continue; }
    ++matched;

    auto const screen_id{ string_at(screen, "id") };
    if (!add_field_to_screen(screen_id, field_id)) {
      tui::warn("No tabs found for screen %s", screen_id.c_str());
    }
  }

  if (matched == 0) {
    tui::warn("No screens found for project %.*s",
              static_cast<int>(project_key.size()),
              project_key.data());
  }
}

std::string jira_client::whoami() {
  auto const res{ call("GET", "/rest/api/2/myself") };
  if (!res.body.is<picojson::object>()) { throw transport_error("Unexpected /myself response"); }
  auto const &obj{ res.body.get<picojson::object>() };
  if (auto name{ string_at(obj, "displayName") }; !name.empty()) { return name; }
  return string_at(obj, "name");
}

}  // namespace rehearse
