#include "cmd.h"
#include "errors.h"
#include "cmds/cmd_common.h"
#include "cmds/cmd_setup.h"
#include "cmds/cmd_show_config.h"

#include <doctest/doctest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace {

class test_cmd : public rehearse::cmd {
 public:
  struct cfg : rehearse::cmd_cfg<test_cmd> {
    bool result{ true };
  };
  test_cmd(cfg cfg, rehearse::config const &env) : cfg_{ cfg }, user_{ env.jira.user } {}
  bool execute() override { return cfg_.result; }

  cfg cfg_;
  std::string user_;
};

// Every issue type and field already exists; records the lookups.
struct existing_schema : rehearse::schema_admin {
  std::vector<std::string> lookups;

  std::optional<std::string> find_issue_type(std::string const &name) override {
    lookups.push_back("type:" + name);
    return "10000";
  }
  std::optional<std::string> find_custom_field(std::string const &name) override {
    lookups.push_back("field:" + name);
    return "customfield_10000";
  }
  std::string create_issue_type(rehearse::issue_type_spec const &) override {
    throw rehearse::validation_error("unexpected create");
  }
  std::string create_custom_field(rehearse::custom_field_spec const &) override {
    throw rehearse::validation_error("unexpected create");
  }
  void add_field_to_default_screen(std::string const &) override {}
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  CHECK(std::is_same_v<test_cmd::cfg::cmd_t, test_cmd>);
  CHECK(std::is_same_v<rehearse::cmd_setup::cfg::cmd_t, rehearse::cmd_setup>);
}

TEST_CASE("cmd factory creates command from cfg and config") {
  rehearse::config env;
  env.jira.user = "svc-rehearse";

  test_cmd::cfg cfg{};
  cfg.result = false;
  auto cmd{ rehearse::cmd::create(cfg, env) };
  REQUIRE(cmd);
  auto *typed{ dynamic_cast<test_cmd *>(cmd.get()) };
  REQUIRE(typed);
  CHECK(typed->user_ == "svc-rehearse");
  CHECK_FALSE(cmd->execute());
}

TEST_CASE("cmd_show_config succeeds without Jira settings") {
  auto cmd{ rehearse::cmd::create(rehearse::cmd_show_config::cfg{}, rehearse::config{}) };
  CHECK(cmd->execute());
}

TEST_CASE("connect_tracker rejects missing settings before any request") {
  rehearse::config env;
  env.jira.base_url = "https://jira.example.test";
  CHECK_THROWS_WITH(rehearse::connect_tracker(env), doctest::Contains("JIRA_USER"));
}

TEST_CASE("make_orchestrator_options carries flags and screen fields") {
  rehearse::config env;
  env.screen_fields = { "customfield_10212" };

  auto const opts{ rehearse::make_orchestrator_options(
      env,
      rehearse::run_flags{ .dry_run = true, .force = false, .concurrency = 2 }) };
  CHECK(opts.dry_run);
  CHECK(opts.max_concurrency == 2);
  CHECK(opts.screen_fields == std::vector<std::string>{ "customfield_10212" });
}

TEST_CASE("build_setup_request without component mapping stays offline") {
  auto const request{ rehearse::build_setup_request(rehearse::config{},
                                                    { rehearse::phase::VERSIONS }) };
  CHECK(request.entities.size() == 25);
  CHECK_FALSE(request.component_source_failed);
  CHECK(std::all_of(request.entities.begin(), request.entities.end(), [](auto const &e) {
    return e.type == rehearse::entity_type::VERSION;
  }));
  CHECK(request.pre_existing.count(rehearse::logical_identity{
      .type = rehearse::entity_type::PROJECT, .name = "Developer Experience", .project_key = "DEVEX" }));
}

TEST_CASE("confirm_destructive skips the prompt for force and dry run") {
  CHECK(rehearse::confirm_destructive(true, rehearse::run_flags{ .force = true }));
  CHECK(rehearse::confirm_destructive(false, rehearse::run_flags{ .dry_run = true }));
}

TEST_CASE("run_schema_phases runs only the selected schema phases") {
  existing_schema admin;

  SUBCASE("entity phases only") {
    CHECK(rehearse::run_schema_phases(admin, { rehearse::phase::VERSIONS }, {}));
    CHECK(admin.lookups.empty());
  }

  SUBCASE("fields") {
    CHECK(rehearse::run_schema_phases(admin, { rehearse::phase::FIELDS }, {}));
    CHECK(admin.lookups.size() == rehearse::schema_custom_fields().size());
    CHECK(std::all_of(admin.lookups.begin(), admin.lookups.end(), [](std::string const &l) {
      return l.starts_with("field:");
    }));
  }

  SUBCASE("every phase") {
    CHECK(rehearse::run_schema_phases(admin, rehearse::all_phases(), {}));
    CHECK(admin.lookups.front() == "type:Constraint");
    CHECK(admin.lookups.size() ==
          rehearse::schema_issue_types().size() + rehearse::schema_custom_fields().size());
  }
}
