#include "schema.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rehearse {

namespace {

struct fake_schema_admin : schema_admin {
  std::map<std::string, std::string> issue_types;
  std::map<std::string, std::string> fields;
  std::vector<std::string> created;
  std::vector<std::string> on_screen;
  std::set<std::string> failing_creates;
  int transient_lookups{ 0 };  // Lookups that throw transport_error before succeeding
  bool screen_fails{ false };

  std::optional<std::string> find_issue_type(std::string const &name) override {
    if (transient_lookups > 0) {
      --transient_lookups;
      throw transport_error("connection reset");
    }
    auto const it{ issue_types.find(name) };
    if (it == issue_types.end()) { return std::nullopt; }
    return it->second;
  }

  std::optional<std::string> find_custom_field(std::string const &name) override {
    auto const it{ fields.find(name) };
    if (it == fields.end()) { return std::nullopt; }
    return it->second;
  }

  std::string create_issue_type(issue_type_spec const &spec) override {
    if (failing_creates.contains(spec.name)) { throw validation_error("permission denied"); }
    created.push_back(spec.name);
    return issue_types[spec.name] = "it-" + std::to_string(created.size());
  }

  std::string create_custom_field(custom_field_spec const &spec) override {
    if (failing_creates.contains(spec.name)) { throw validation_error("permission denied"); }
    created.push_back(spec.name);
    return fields[spec.name] = "customfield_" + std::to_string(10300 + created.size());
  }

  void add_field_to_default_screen(std::string const &field_id) override {
    if (screen_fails) { throw validation_error("screen locked"); }
    on_screen.push_back(field_id);
  }
};

schema_options quiet_options(bool dry_run = false) {
  schema_options options{ .dry_run = dry_run };
  options.retry.sleep = [](std::chrono::milliseconds) {};
  return options;
}

schema_outcome const &outcome_named(std::vector<schema_outcome> const &outcomes,
                                    std::string const &name) {
  for (auto const &o : outcomes) {
    if (o.name == name) { return o; }
  }
  FAIL("no outcome for " << name);
  return outcomes.front();
}

void seed_hierarchy_types(fake_schema_admin &admin) {
  admin.issue_types = { { "Strategic Objective", "1" },
                        { "Portfolio Epic", "2" },
                        { "Business Outcome", "3" },
                        { "Feature", "4" },
                        { "Story", "5" } };
}

}  // namespace

TEST_CASE("schema_custom_fields: constraint fields then story triggers") {
  auto const &fields{ schema_custom_fields() };
  REQUIRE(fields.size() == 8);
  CHECK(fields[0].name == "Risk Materiality");
  CHECK(fields[1].name == "Mitigation Plan");
  CHECK(fields[2].name == "Guild");
  CHECK(fields[2].options ==
        std::vector<std::string>{ "Security", "Data", "Operations", "Enterprise Architecture" });
  for (std::size_t i{ 3 }; i < fields.size(); ++i) {
    CHECK(fields[i].name.starts_with("Risk: "));
    CHECK_FALSE(fields[i].searcher);
  }
}

TEST_CASE("schema_setup_issue_types: creates Constraint and verifies the hierarchy") {
  fake_schema_admin admin;
  seed_hierarchy_types(admin);

  auto const outcomes{ schema_setup_issue_types(admin, quiet_options()) };
  REQUIRE(outcomes.size() == schema_issue_types().size());
  CHECK(admin.created == std::vector<std::string>{ "Constraint" });
  CHECK(outcome_named(outcomes, "Constraint").status == schema_status::CREATED);
  CHECK(outcome_named(outcomes, "Feature").status == schema_status::EXISTS);
  CHECK(outcome_named(outcomes, "Feature").id == "4");
  CHECK(schema_ok(outcomes));

  SUBCASE("second run finds everything") {
    auto const again{ schema_setup_issue_types(admin, quiet_options()) };
    CHECK(admin.created.size() == 1);
    CHECK(outcome_named(again, "Constraint").status == schema_status::EXISTS);
  }
}

TEST_CASE("schema_setup_issue_types: missing hierarchy type is only a warning") {
  fake_schema_admin admin;
  seed_hierarchy_types(admin);
  admin.issue_types.erase("Portfolio Epic");

  auto const outcomes{ schema_setup_issue_types(admin, quiet_options()) };
  CHECK(outcome_named(outcomes, "Portfolio Epic").status == schema_status::MISSING);
  CHECK(admin.created == std::vector<std::string>{ "Constraint" });
  CHECK(schema_ok(outcomes));
}

TEST_CASE("schema_setup_issue_types: transient lookup failures are retried") {
  fake_schema_admin admin;
  seed_hierarchy_types(admin);
  admin.transient_lookups = 2;

  auto const outcomes{ schema_setup_issue_types(admin, quiet_options()) };
  CHECK(schema_ok(outcomes));
  CHECK(admin.transient_lookups == 0);
}

TEST_CASE("schema_setup_issue_types: create failure is reported") {
  fake_schema_admin admin;
  seed_hierarchy_types(admin);
  admin.failing_creates.insert("Constraint");

  auto const outcomes{ schema_setup_issue_types(admin, quiet_options()) };
  auto const &constraint{ outcome_named(outcomes, "Constraint") };
  CHECK(constraint.status == schema_status::FAILED);
  CHECK(constraint.reason == "permission denied");
  CHECK_FALSE(schema_ok(outcomes));
}

TEST_CASE("schema_setup_custom_fields: creates missing fields on the default screen") {
  fake_schema_admin admin;
  admin.fields["Mitigation Plan"] = "customfield_10212";

  auto const outcomes{ schema_setup_custom_fields(admin, quiet_options()) };
  REQUIRE(outcomes.size() == schema_custom_fields().size());
  CHECK(outcome_named(outcomes, "Mitigation Plan").status == schema_status::EXISTS);
  CHECK(admin.created.size() == schema_custom_fields().size() - 1);
  CHECK(admin.on_screen.size() == admin.created.size());
  CHECK(schema_ok(outcomes));

  auto const summary{ schema_render_summary(outcomes) };
  CHECK(summary.find("custom field 'Mitigation Plan': exists (customfield_10212)") !=
        std::string::npos);
  CHECK(summary.find("Guild: Security; Data; Operations; Enterprise Architecture") !=
        std::string::npos);
}

TEST_CASE("schema_setup_custom_fields: screen failure does not fail the field") {
  fake_schema_admin admin;
  admin.screen_fails = true;

  auto const outcomes{ schema_setup_custom_fields(admin, quiet_options()) };
  CHECK(outcome_named(outcomes, "Guild").status == schema_status::CREATED);
  CHECK(schema_ok(outcomes));
}

TEST_CASE("schema_setup_custom_fields: one failing field leaves the rest") {
  fake_schema_admin admin;
  admin.failing_creates.insert("Risk Materiality");

  auto const outcomes{ schema_setup_custom_fields(admin, quiet_options()) };
  CHECK(outcome_named(outcomes, "Risk Materiality").status == schema_status::FAILED);
  CHECK(outcome_named(outcomes, "Guild").status == schema_status::CREATED);
  CHECK_FALSE(schema_ok(outcomes));
}

TEST_CASE("schema setup: dry run creates nothing") {
  fake_schema_admin admin;
  seed_hierarchy_types(admin);

  auto const types{ schema_setup_issue_types(admin, quiet_options(true)) };
  auto const fields{ schema_setup_custom_fields(admin, quiet_options(true)) };
  CHECK(admin.created.empty());
  CHECK(admin.on_screen.empty());
  CHECK(outcome_named(types, "Constraint").status == schema_status::CREATED);
  CHECK(outcome_named(fields, "Guild").status == schema_status::CREATED);
  CHECK(outcome_named(fields, "Guild").id.empty());
}

}  // namespace rehearse
