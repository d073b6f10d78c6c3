#include "jira_client.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rehearse {

namespace {

constexpr char kBase[]{ "https://jira.example.test" };

// Canned responses keyed by "METHOD /path"; repeated keys are served in order.
struct scripted_http {
  std::map<std::string, std::deque<http_response>> routes;
  std::vector<http_request> requests;

  void on(std::string const &key, long status, std::string body = {}) {
    routes[key].push_back({ .status = status, .body = std::move(body) });
  }

  http_transport_t transport() {
    return [this](http_request const &req) {
      requests.push_back(req);
      auto const key{ req.method + " " + req.url.substr(std::string{ kBase }.size()) };
      auto it{ routes.find(key) };
      if (it == routes.end() || it->second.empty()) {
        return http_response{ .status = 404, .body = "no route for " + key };
      }
      auto res{ it->second.front() };
      if (it->second.size() > 1) { it->second.pop_front(); }
      return res;
    };
  }

  picojson::object body_of(std::size_t i) const {
    picojson::value v;
    REQUIRE(requests.at(i).body.has_value());
    REQUIRE(picojson::parse(v, *requests.at(i).body).empty());
    return v.get<picojson::object>();
  }
};

struct jira_fixture {
  scripted_http http;
  jira_client client{ jira_settings{ .base_url = std::string{ kBase } + "/",
                                     .user = "svc-rehearse",
                                     .token = "secret-token" },
                      http.transport() };
};

entity_definition constraint_def() {
  return { .type = entity_type::CONSTRAINT,
           .name = "Secrets rotation policy must be implemented",
           .project_key = "DEVEX",
           .parent = parent_ref{ entity_type::FEATURE, "Secrets injection automation" },
           .attributes = { { "description", "Rotate every 90 days." },
                           { "guild", "Security" },
                           { "risk_materiality", "High" },
                           { "mitigation_plan", "Integrate with Vault." },
                           { "status", "In Progress" } } };
}

}  // namespace

TEST_CASE("jira_escape_jql: quotes and backslashes") {
  CHECK(jira_escape_jql("plain") == "plain");
  CHECK(jira_escape_jql(R"(say "hi" \ now)") == R"(say \"hi\" \\ now)");
}

TEST_CASE("jira_issue_fields: hierarchy issue uses Parent Link") {
  entity_definition const def{ .type = entity_type::PORTFOLIO_EPIC,
                               .name = "Self-Service Infrastructure",
                               .project_key = "DEVEX",
                               .attributes = { { "description", "On demand" } } };
  auto const body{ jira_issue_fields(def, tracker_ref{ entity_type::STRATEGIC_OBJECTIVE, "DEVEX-1" }, {}) };
  auto const &fields{ body.get<picojson::object>().at("fields").get<picojson::object>() };

  CHECK(fields.at("project").get<picojson::object>().at("key").get<std::string>() == "DEVEX");
  CHECK(fields.at("issuetype").get<picojson::object>().at("name").get<std::string>() ==
        "Portfolio Epic");
  CHECK(fields.at("summary").get<std::string>() == "Self-Service Infrastructure");
  CHECK(fields.at("description").get<std::string>() == "On demand");
  CHECK(fields.at(kJiraParentLinkField).get<std::string>() == "DEVEX-1");
  CHECK_FALSE(fields.contains("parent"));
}

TEST_CASE("jira_issue_fields: constraint carries mitigation and governance notes") {
  auto const body{ jira_issue_fields(constraint_def(),
                                     tracker_ref{ entity_type::FEATURE, "DEVEX-9" },
                                     std::string{ "customfield_10212" }) };
  auto const &fields{ body.get<picojson::object>().at("fields").get<picojson::object>() };

  CHECK(fields.at("customfield_10212").get<std::string>() == "Integrate with Vault.");
  CHECK_FALSE(fields.contains(kJiraParentLinkField));
  auto const &desc{ fields.at("description").get<std::string>() };
  CHECK(desc.find("Guild: Security") != std::string::npos);
  CHECK(desc.find("Risk Materiality: High") != std::string::npos);
}

TEST_CASE("jira_constraint_transitions: follow the workflow path") {
  CHECK(jira_constraint_transitions("Identified").empty());
  CHECK(jira_constraint_transitions("In Progress") == std::vector<std::string>{ "Start Work" });
  CHECK(jira_constraint_transitions("Closed") ==
        std::vector<std::string>{ "Start Work", "Submit for Review", "Approve & Close" });
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: project lookup maps 404 to absent") {
  http.on("GET /rest/api/2/project/GOV", 200, R"({"key":"GOV","name":"Governance"})");

  auto const found{ client.find_entity({ entity_type::PROJECT, "Governance", "GOV" }, {}) };
  REQUIRE(found);
  CHECK(found->ref == tracker_ref{ entity_type::PROJECT, "GOV" });
  CHECK_FALSE(client.find_entity({ entity_type::PROJECT, "Data", "DATA" }, {}).has_value());

  REQUIRE_FALSE(http.requests.empty());
  auto const &headers{ http.requests.front().headers };
  CHECK(std::ranges::find(headers,
                          std::pair<std::string, std::string>{ "Authorization",
                                                               "Bearer secret-token" }) !=
        headers.end());
  CHECK(http.requests.front().url == "https://jira.example.test/rest/api/2/project/GOV");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: status codes map onto the error taxonomy") {
  entity_definition const project{ .type = entity_type::PROJECT, .name = "Data", .project_key = "DATA" };

  SUBCASE("429 is a rate limit with Retry-After") {
    http.routes["POST /rest/api/2/project"].push_back(
        { .status = 429, .body = "slow down", .retry_after = std::chrono::milliseconds{ 3000 } });
    try {
      client.create_entity(project, {});
      FAIL("expected rate_limit_error");
    } catch (rate_limit_error const &ex) {
      CHECK(ex.retry_after() == std::chrono::milliseconds{ 3000 });
    }
  }

  SUBCASE("5xx is a transport failure") {
    http.on("POST /rest/api/2/project", 503, "unavailable");
    CHECK_THROWS_AS(client.create_entity(project, {}), transport_error);
  }

  SUBCASE("other 4xx is a validation failure") {
    http.on("POST /rest/api/2/project", 400, R"({"errors":{"key":"taken"}})");
    CHECK_THROWS_AS(client.create_entity(project, {}), validation_error);
  }
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: project create payload") {
  http.on("POST /rest/api/2/project", 201, R"({"id":10000,"key":"DATA"})");
  entity_definition const project{ .type = entity_type::PROJECT,
                                   .name = "Data & Analytics",
                                   .project_key = "DATA",
                                   .attributes = { { "description", "Data initiatives" } } };

  CHECK(client.create_entity(project, {}) == tracker_ref{ entity_type::PROJECT, "DATA" });
  auto const body{ http.body_of(0) };
  CHECK(body.at("key").get<std::string>() == "DATA");
  CHECK(body.at("projectTypeKey").get<std::string>() == "software");
  CHECK(body.at("lead").get<std::string>() == "svc-rehearse");
  CHECK(body.at("description").get<std::string>() == "Data initiatives");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: issue search keeps the exact summary") {
  http.on("POST /rest/api/2/search",
          200,
          R"({"startAt":0,"total":2,"issues":[
               {"key":"DEVEX-7","fields":{"summary":"Cloud IDE provisioning v2",
                 "issuetype":{"name":"Feature"},"customfield_10108":"DEVEX-3"}},
               {"key":"DEVEX-5","fields":{"summary":"Cloud IDE provisioning",
                 "issuetype":{"name":"Feature"},"customfield_10108":"DEVEX-4"}}]})");

  auto const found{ client.find_entity({ entity_type::FEATURE, "Cloud IDE provisioning", "DEVEX" },
                                        {}) };
  REQUIRE(found);
  CHECK(found->ref == tracker_ref{ entity_type::FEATURE, "DEVEX-5" });
  CHECK(found->parent == tracker_ref{ entity_type::BUSINESS_OUTCOME, "DEVEX-4" });

  auto const jql{ http.body_of(0).at("jql").get<std::string>() };
  CHECK(jql ==
        R"(project = DEVEX AND summary ~ "Cloud IDE provisioning" AND issuetype = "Feature")");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: constraint parent comes from its Blocks link") {
  http.on("POST /rest/api/2/search",
          200,
          R"({"total":1,"issues":[{"key":"DEVEX-40","fields":{
               "summary":"Secrets rotation policy must be implemented",
               "issuetype":{"name":"Constraint"},
               "issuelinks":[{"type":{"name":"Relates"},"outwardIssue":{"key":"DEVEX-2",
                                "fields":{"issuetype":{"name":"Feature"}}}},
                             {"type":{"name":"Blocks"},"inwardIssue":{"key":"DEVEX-9",
                                "fields":{"summary":"Secrets injection automation",
                                          "issuetype":{"name":"Feature"}}}}]}}]})");

  auto const found{ client.find_entity(constraint_def().identity(), {}) };
  REQUIRE(found);
  CHECK(found->ref == tracker_ref{ entity_type::CONSTRAINT, "DEVEX-40" });
  CHECK(found->parent == tracker_ref{ entity_type::FEATURE, "DEVEX-9" });
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: constraint create links and transitions") {
  http.on("GET /rest/api/2/field",
          200,
          R"([{"id":"summary","name":"Summary","custom":false},
              {"id":"customfield_10212","name":"Mitigation Plan","custom":true}])");
  http.on("POST /rest/api/2/issue", 201, R"({"id":"10040","key":"DEVEX-40"})");
  http.on("POST /rest/api/2/issueLink", 201);
  http.on("GET /rest/api/2/issue/DEVEX-40/transitions",
          200,
          R"({"transitions":[{"id":"11","name":"Start Work"}]})");
  http.on("POST /rest/api/2/issue/DEVEX-40/transitions", 204);

  auto const ref{ client.create_entity(constraint_def(), tracker_ref{ entity_type::FEATURE, "DEVEX-9" }) };
  CHECK(ref == tracker_ref{ entity_type::CONSTRAINT, "DEVEX-40" });

  REQUIRE(http.requests.size() == 5);
  CHECK(http.requests[0].url.ends_with("/rest/api/2/field"));

  auto const issue{ http.body_of(1).at("fields").get<picojson::object>() };
  CHECK(issue.at("customfield_10212").get<std::string>() == "Integrate with Vault.");

  auto const link{ http.body_of(2) };
  CHECK(link.at("type").get<picojson::object>().at("name").get<std::string>() == "Blocks");
  CHECK(link.at("inwardIssue").get<picojson::object>().at("key").get<std::string>() == "DEVEX-9");
  CHECK(link.at("outwardIssue").get<picojson::object>().at("key").get<std::string>() == "DEVEX-40");

  auto const transition{ http.body_of(4) };
  CHECK(transition.at("transition").get<picojson::object>().at("id").get<std::string>() == "11");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: failed link does not fail the create") {
  http.on("GET /rest/api/2/field", 200, "[]");
  http.on("POST /rest/api/2/issue", 201, R"({"key":"DEVEX-41"})");
  http.on("POST /rest/api/2/issueLink", 400, R"({"errorMessages":["No link type"]})");

  auto def{ constraint_def() };
  def.attributes["status"] = "Identified";
  CHECK(client.create_entity(def, tracker_ref{ entity_type::FEATURE, "DEVEX-9" }) ==
        tracker_ref{ entity_type::CONSTRAINT, "DEVEX-41" });
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: project children are paged") {
  auto const page{ [](int start, int count, int total) {
    std::string issues;
    for (int i{ 0 }; i < count; ++i) {
      if (!issues.empty()) { issues += ","; }
      auto const n{ std::to_string(start + i + 1) };
      issues += R"({"key":"GOV-)" + n + R"(","fields":{"summary":"Objective )" + n +
                R"(","issuetype":{"name":"Strategic Objective"}}})";
    }
    return R"({"startAt":)" + std::to_string(start) + R"(,"total":)" + std::to_string(total) +
           R"(,"issues":[)" + issues + "]}";
  } };
  http.on("POST /rest/api/2/search", 200, page(0, 100, 150));
  http.on("POST /rest/api/2/search", 200, page(100, 50, 150));

  auto const children{ client.list_children({ entity_type::PROJECT, "GOV" }) };
  CHECK(children.size() == 150);
  CHECK(children.front().ref == tracker_ref{ entity_type::STRATEGIC_OBJECTIVE, "GOV-1" });
  CHECK(children.back().name == "Objective 150");

  REQUIRE(http.requests.size() == 2);
  CHECK(http.body_of(0).at("startAt").get<double>() == 0.0);
  CHECK(http.body_of(0).at("jql").get<std::string>() ==
        R"(project = GOV AND issuetype in ("Strategic Objective", "Portfolio Epic", )"
        R"("Business Outcome", "Feature", "Constraint"))");
  CHECK(http.body_of(1).at("startAt").get<double>() == 100.0);
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: outcome children include linked constraints") {
  http.on("POST /rest/api/2/search",
          200,
          R"({"total":1,"issues":[{"key":"DEVEX-6","fields":{"summary":"IaC templates",
               "issuetype":{"name":"Feature"}}}]})");
  http.on("GET /rest/api/2/issue/DEVEX-3?fields=issuelinks",
          200,
          R"({"key":"DEVEX-3","fields":{"issuelinks":[
               {"type":{"name":"Blocks"},"outwardIssue":{"key":"DEVEX-40",
                 "fields":{"summary":"WAF rules","issuetype":{"name":"Constraint"}}}}]}})");

  auto const children{ client.list_children({ entity_type::BUSINESS_OUTCOME, "DEVEX-3" }) };
  REQUIRE(children.size() == 2);
  CHECK(children[0].ref == tracker_ref{ entity_type::FEATURE, "DEVEX-6" });
  CHECK(children[1].ref == tracker_ref{ entity_type::CONSTRAINT, "DEVEX-40" });
  CHECK(children[1].name == "WAF rules");
  CHECK(http.body_of(0).at("jql").get<std::string>() == R"("Parent Link" = DEVEX-3)");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: versions are found by name") {
  http.on("GET /rest/api/2/project/AIOPS/versions",
          200,
          R"([{"id":"10100","name":"v1.0.0"},{"id":"10101","name":"v2.0.0"}])");

  auto const found{ client.find_entity({ entity_type::VERSION, "v2.0.0", "AIOPS" }, {}) };
  REQUIRE(found);
  CHECK(found->ref == tracker_ref{ entity_type::VERSION, "10101" });
  CHECK(found->parent == tracker_ref{ entity_type::PROJECT, "AIOPS" });
  CHECK_FALSE(client.find_entity({ entity_type::VERSION, "v9.0.0", "AIOPS" }, {}).has_value());
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: feature version sets fixVersions") {
  http.on("PUT /rest/api/2/issue/TECHCON-12", 204);
  entity_definition const def{ .type = entity_type::FEATURE_VERSION,
                               .name = "Service mesh adoption",
                               .project_key = "TECHCON",
                               .parent = parent_ref{ entity_type::FEATURE, "Service mesh adoption" },
                               .attributes = { { "version", "v2.1.0" } } };

  CHECK(client.create_entity(def, tracker_ref{ entity_type::FEATURE, "TECHCON-12" }) ==
        tracker_ref{ entity_type::FEATURE_VERSION, "TECHCON-12" });
  auto const versions{
    http.body_of(0).at("fields").get<picojson::object>().at("fixVersions").get<picojson::array>()
  };
  REQUIRE(versions.size() == 1);
  CHECK(versions[0].get<picojson::object>().at("name").get<std::string>() == "v2.1.0");

  CHECK_THROWS_AS(client.create_entity(def, std::nullopt), validation_error);
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: component mapping reuses an existing component") {
  http.on("GET /rest/api/2/project/DATA/components", 200, R"([{"id":"10300","name":"Billing"}])");
  http.on("PUT /rest/api/2/issue/DATA-8", 204);
  entity_definition const def{ .type = entity_type::COMPONENT_MAPPING,
                               .name = "Billing",
                               .project_key = "DATA",
                               .parent = parent_ref{ entity_type::FEATURE, "Feature store" } };

  CHECK(client.create_entity(def, tracker_ref{ entity_type::FEATURE, "DATA-8" }) ==
        tracker_ref{ entity_type::COMPONENT_MAPPING, "10300" });
  REQUIRE(http.requests.size() == 2);
  auto const add{ http.body_of(1)
                      .at("update")
                      .get<picojson::object>()
                      .at("components")
                      .get<picojson::array>()
                      .at(0)
                      .get<picojson::object>()
                      .at("add")
                      .get<picojson::object>() };
  CHECK(add.at("id").get<std::string>() == "10300");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: delete treats 404 as already gone") {
  http.on("DELETE /rest/api/2/issue/GOV-3", 404, "gone");
  CHECK_NOTHROW(client.delete_entity({ entity_type::FEATURE, "GOV-3" }));

  http.on("DELETE /rest/api/2/project/GOV", 403, "forbidden");
  CHECK_THROWS_AS(client.delete_entity({ entity_type::PROJECT, "GOV" }), validation_error);
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: screen attach tolerates fields already present") {
  http.on("GET /rest/api/2/screens",
          200,
          R"({"values":[{"id":1,"name":"GOV: Scrum Default Issue Screen"},
                        {"id":2,"name":"DATA: Scrum Default Issue Screen"}]})");
  http.on("GET /rest/api/2/screens/1/tabs", 200, R"([{"id":10,"name":"Field Tab"}])");
  http.on("POST /rest/api/2/screens/1/tabs/10/fields",
          400,
          R"({"errorMessages":["Field customfield_10212 already exists on the screen."]})");

  CHECK_NOTHROW(client.attach_field_to_screens("customfield_10212", "GOV"));
  REQUIRE(http.requests.size() == 3);
  CHECK(http.body_of(2).at("fieldId").get<std::string>() == "customfield_10212");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: whoami returns the display name") {
  http.on("GET /rest/api/2/myself", 200, R"({"name":"svc","displayName":"Service Account"})");
  CHECK(client.whoami() == "Service Account");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: issue types are found by name") {
  http.on("GET /rest/api/2/issuetype",
          200,
          R"([{"id":"10001","name":"Story"},{"id":"10400","name":"Constraint"}])");
  CHECK(client.find_issue_type("Constraint") == "10400");
  CHECK_FALSE(client.find_issue_type("Portfolio Epic"));
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: issue type create payload") {
  http.on("POST /rest/api/2/issuetype", 201, R"({"id":"10400","name":"Constraint"})");

  CHECK(client.create_issue_type(schema_issue_types().front()) == "10400");
  auto const body{ http.body_of(0) };
  CHECK(body.at("name").get<std::string>() == "Constraint");
  CHECK(body.at("type").get<std::string>() == "standard");
  CHECK(body.at("description").get<std::string>() ==
        "Governance constraint that blocks deployment until resolved");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: custom field lookup ignores system fields") {
  http.on("GET /rest/api/2/field",
          200,
          R"([{"id":"guild","name":"Guild","custom":false},
              {"id":"customfield_10300","name":"Guild","custom":true}])");
  CHECK(client.find_custom_field("Guild") == "customfield_10300");
  CHECK_FALSE(client.find_custom_field("Risk Materiality"));
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: custom field create payload") {
  http.on("POST /rest/api/2/field", 201, R"({"id":"customfield_10301"})");
  http.on("POST /rest/api/2/field", 201, R"({"id":"customfield_10302"})");

  auto const &fields{ schema_custom_fields() };
  auto const textarea{ std::ranges::find_if(fields, [](custom_field_spec const &f) {
    return f.name == "Mitigation Plan";
  }) };
  REQUIRE(textarea != fields.end());
  CHECK(client.create_custom_field(*textarea) == "customfield_10301");
  auto const with_searcher{ http.body_of(0) };
  CHECK(with_searcher.at("type").get<std::string>() ==
        "com.atlassian.jira.plugin.system.customfieldtypes:textarea");
  CHECK(with_searcher.at("searcherKey").get<std::string>() ==
        "com.atlassian.jira.plugin.system.customfieldtypes:textsearcher");

  CHECK(client.create_custom_field(fields.front()) == "customfield_10302");
  auto const select{ http.body_of(1) };
  CHECK(select.at("name").get<std::string>() == "Risk Materiality");
  CHECK(select.count("searcherKey") == 0);
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: default screen uses its first tab") {
  http.on("GET /rest/api/2/screens/1/tabs", 200, R"([{"id":11,"name":"Field Tab"},{"id":12}])");
  http.on("POST /rest/api/2/screens/1/tabs/11/fields", 200, R"({"id":"customfield_10301"})");

  client.add_field_to_default_screen("customfield_10301");
  REQUIRE(http.requests.size() == 2);
  CHECK(http.body_of(1).at("fieldId").get<std::string>() == "customfield_10301");
}

TEST_CASE_FIXTURE(jira_fixture, "jira_client: default screen without tabs is an error") {
  http.on("GET /rest/api/2/screens/1/tabs", 200, "[]");
  CHECK_THROWS_AS(client.add_field_to_default_screen("customfield_10301"), validation_error);
}

}  // namespace rehearse
