#include "cmd_common.h"

#include "component_mapping.h"
#include "confirm.h"
#include "http.h"
#include "tui.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <map>
#include <string_view>

namespace rehearse {

namespace {

constexpr char kRule[]{ "============================================================" };
constexpr char kThinRule[]{ "----------------------------------------" };

}  // namespace

void print_banner(bool dry_run) {
  tui::print_stdout("%s\n", kRule);
  tui::print_stdout("rehearse: governance fixture provisioning for Jira Data Center\n");
  tui::print_stdout("%s\n\n", kRule);
  if (dry_run) { tui::print_stdout("*** DRY RUN MODE - No changes will be made ***\n\n"); }
}

void print_config_summary(config const &cfg) {
  tui::print_stdout("Configuration:\n%s\n", kThinRule);
  for (auto const &line : config_describe(cfg)) { tui::print_stdout("%s\n", line.c_str()); }
  tui::print_stdout("\n");
}

void print_data_summary() {
  tui::print_stdout("Data to Create:\n%s\n", kThinRule);

  auto const projects{ catalog_projects() };
  tui::print_stdout("  Projects: %zu\n", projects.size());
  for (auto const &p : projects) {
    tui::print_stdout("    - %s: %s\n", p.key.c_str(), p.name.c_str());
  }

  std::map<entity_type, std::size_t> by_type;
  std::map<std::string, std::size_t> by_guild;
  for (auto const &def : catalog_builtin()) {
    ++by_type[def.type];
    if (def.type == entity_type::CONSTRAINT) { ++by_guild[def.attribute("guild")]; }
  }

  tui::print_stdout("\n  Hierarchy:\n");
  for (auto const type : { entity_type::STRATEGIC_OBJECTIVE,
                           entity_type::PORTFOLIO_EPIC,
                           entity_type::BUSINESS_OUTCOME,
                           entity_type::FEATURE }) {
    auto const name{ entity_type_display_name(type) };
    tui::print_stdout("    - %-22.*s %zu\n",
                      static_cast<int>(name.size()),
                      name.data(),
                      by_type[type]);
  }

  tui::print_stdout("\n  Issue types: %zu\n  Custom fields: %zu\n",
                    schema_issue_types().size(),
                    schema_custom_fields().size());

  tui::print_stdout("\n  Constraints: %zu\n    By Guild:\n", by_type[entity_type::CONSTRAINT]);
  for (auto const &[guild, count] : by_guild) {
    tui::print_stdout("      - %s: %zu\n", guild.c_str(), count);
  }
  tui::print_stdout("\n");
}

std::unique_ptr<jira_client> connect_tracker(config const &cfg) {
  config_validate(cfg);

  auto client{ std::make_unique<jira_client>(
      cfg.jira,
      http_make_transport(http_options{ .verify_ssl = cfg.jira.verify_ssl })) };

  tui::print_stdout("Testing Jira connection...\n");
  auto const who{ client->whoami() };
  tui::print_stdout("  Connected as: %s\n\n", who.c_str());
  return client;
}

orchestrator_options make_orchestrator_options(config const &cfg, run_flags const &flags) {
  return orchestrator_options{ .dry_run = flags.dry_run,
                               .max_concurrency = flags.concurrency,
                               .retry = retry_policy{},
                               .screen_fields = cfg.screen_fields };
}

setup_request build_setup_request(config const &cfg, std::vector<phase> const &phases) {
  auto const &catalog{ catalog_builtin() };
  auto selection{ catalog_select(catalog, phases) };
  setup_request request{ .entities = std::move(selection.entities),
                         .pre_existing = std::move(selection.pre_existing) };

  bool const wants_components{ std::find(phases.begin(),
                                         phases.end(),
                                         phase::COMPONENT_MAPPING) != phases.end() };
  if (!wants_components) { return request; }

  try {
    pg_component_source source{ cfg.db };
    auto const apps{ source.fetch_applications() };
    tui::info("Loaded %zu business applications from %s", apps.size(), cfg.db.name.c_str());
    for (auto &def : component_mappings_assign(apps, catalog)) {
      request.entities.push_back(std::move(def));
    }
  } catch (std::exception const &ex) {
    tui::error("Component mapping skipped: %s", ex.what());
    request.component_source_failed = true;
  }
  return request;
}

bool run_schema_phases(schema_admin &admin,
                       std::vector<phase> const &phases,
                       run_flags const &flags) {
  auto const selected{ [&phases](phase p) {
    return std::find(phases.begin(), phases.end(), p) != phases.end();
  } };
  if (!selected(phase::ISSUE_TYPES) && !selected(phase::FIELDS)) { return true; }

  schema_options const options{ .dry_run = flags.dry_run };
  std::vector<schema_outcome> outcomes;
  if (selected(phase::ISSUE_TYPES)) {
    tui::print_stdout("Setting up issue types...\n");
    auto types{ schema_setup_issue_types(admin, options) };
    outcomes.insert(outcomes.end(), types.begin(), types.end());
  }
  if (selected(phase::FIELDS)) {
    tui::print_stdout("Setting up custom fields...\n");
    auto fields{ schema_setup_custom_fields(admin, options) };
    outcomes.insert(outcomes.end(), fields.begin(), fields.end());
  }

  tui::print_stdout("\nSchema:\n%s\n", schema_render_summary(outcomes).c_str());
  return schema_ok(outcomes);
}

bool finish_run(run_report const &report, bool dry_run) {
  tui::print_stdout("\n%s\n", report.render_summary(dry_run).c_str());
  if (dry_run) {
    tui::print_stdout("\nThis was a dry run. Re-run without --dry-run to apply changes.\n");
  }
  return report.ok();
}

bool confirm_destructive(bool include_projects, run_flags const &flags) {
  tui::print_stdout("\n%s\n", kRule);
  if (include_projects) {
    tui::print_stdout("WARNING: DESTRUCTIVE OPERATION\n%s\n", kRule);
    tui::print_stdout("\nThis will DELETE all governance projects and their issues:\n");
    for (auto const &p : catalog_projects()) {
      tui::print_stdout("  - %s: %s\n", p.key.c_str(), p.name.c_str());
    }
  } else {
    tui::print_stdout("TEARDOWN: Deleting all issues (keeping projects)\n%s\n", kRule);
  }

  if (flags.force || flags.dry_run) { return true; }
  if (confirm_prompt(confirm_token(include_projects), std::cin)) { return true; }

  tui::print_stdout("Aborted.\n");
  return false;
}

}  // namespace rehearse
