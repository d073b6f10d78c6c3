#include "cli.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "rehearse - provision and tear down Jira governance fixtures" };
  app.allow_windows_style_options(false);

  struct {
    bool projects{ false };
    bool issue_types{ false };
    bool fields{ false };
    bool hierarchy{ false };
    bool constraints{ false };
    bool versions{ false };
    bool feature_versions{ false };
    bool component_mapping{ false };
    bool all{ false };
  } phases;

  auto *projects_flag{
    app.add_flag("--projects", phases.projects, "Create the governance projects")
  };
  auto *issue_types_flag{ app.add_flag(
      "--issue-types",
      phases.issue_types,
      "Create the Constraint issue type and verify the hierarchy issue types") };
  auto *fields_flag{ app.add_flag("--fields",
                                  phases.fields,
                                  "Create governance and story risk custom fields") };
  auto *hierarchy_flag{ app.add_flag(
      "--hierarchy",
      phases.hierarchy,
      "Create strategic objectives, portfolio epics, business outcomes and features") };
  auto *constraints_flag{ app.add_flag("--constraints",
                                       phases.constraints,
                                       "Create constraints linked to outcomes and features") };
  auto *versions_flag{
    app.add_flag("--versions", phases.versions, "Create fix versions in each project")
  };
  auto *feature_versions_flag{ app.add_flag("--feature-versions",
                                            phases.feature_versions,
                                            "Assign features to unreleased fix versions") };
  auto *component_mapping_flag{ app.add_flag(
      "--component-mapping",
      phases.component_mapping,
      "Map business applications from the database to feature components") };
  auto *all_flag{ app.add_flag("--all", phases.all, "Run every setup phase") };

  bool teardown{ false };
  bool teardown_all{ false };
  bool rebuild{ false };
  auto *teardown_flag{ app.add_flag(
      "--teardown", teardown, "Delete every governance issue, keeping the projects") };
  auto *teardown_all_flag{ app.add_flag(
      "--teardown-all", teardown_all, "Delete every governance issue and the projects") };
  auto *rebuild_flag{
    app.add_flag("--rebuild", rebuild, "Teardown (keeping projects), then run every phase")
  };

  run_flags flags;
  app.add_flag("-f,--force", flags.force, "Skip the confirmation prompt");
  app.add_flag("--dry-run", flags.dry_run, "Log intended changes without applying them");
  app.add_option("--concurrency", flags.concurrency, "Maximum concurrent tracker requests")
      ->check(CLI::Range(1, 64));

  bool test_connection{ false };
  bool show_config{ false };
  app.add_flag("--test-connection", test_connection, "Verify Jira credentials and exit");
  app.add_flag("--show-config", show_config, "Print configuration and catalog summary");

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  std::vector<CLI::Option *> const phase_flags{ projects_flag,      issue_types_flag,
                                                fields_flag,        hierarchy_flag,
                                                constraints_flag,   versions_flag,
                                                feature_versions_flag,
                                                component_mapping_flag,
                                                all_flag };
  for (auto *destructive : { teardown_flag, teardown_all_flag, rebuild_flag }) {
    for (auto *other : { teardown_flag, teardown_all_flag, rebuild_flag }) {
      if (other != destructive) { destructive->excludes(other); }
    }
    for (auto *p : phase_flags) { destructive->excludes(p); }
  }

  cli_args args{};
  bool parsed{ false };

  try {
    app.parse(argc, argv);
    parsed = true;
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
    args.help_requested = true;
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  // Handle trace logging: --trace defaults to stderr if no value provided
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.rfind("file:", 0) == 0 && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        parsed = false;
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (!parsed) { return args; }

  if (show_config) {
    args.cmd_cfg = cmd_show_config::cfg{};
    return args;
  }

  if (teardown || teardown_all) {
    cmd_teardown::cfg cfg{};
    cfg.include_projects = teardown_all;
    cfg.flags = flags;
    args.cmd_cfg = cfg;
    return args;
  }

  if (rebuild) {
    cmd_rebuild::cfg cfg{};
    cfg.flags = flags;
    args.cmd_cfg = cfg;
    return args;
  }

  cmd_setup::cfg setup{};
  setup.flags = flags;
  for (auto const p : all_phases()) {
    bool selected{ phases.all };
    switch (p) {
      case phase::PROJECTS: selected |= phases.projects; break;
      case phase::ISSUE_TYPES: selected |= phases.issue_types; break;
      case phase::FIELDS: selected |= phases.fields; break;
      case phase::HIERARCHY: selected |= phases.hierarchy; break;
      case phase::CONSTRAINTS: selected |= phases.constraints; break;
      case phase::VERSIONS: selected |= phases.versions; break;
      case phase::FEATURE_VERSIONS: selected |= phases.feature_versions; break;
      case phase::COMPONENT_MAPPING: selected |= phases.component_mapping; break;
    }
    if (selected) { setup.phases.push_back(p); }
  }

  if (!setup.phases.empty()) {
    args.cmd_cfg = setup;
  } else if (test_connection) {
    args.cmd_cfg = cmd_test_connection::cfg{};
  } else {
    args.cli_output =
        app.help() + "\nError: No action specified. Use --all or specify individual phases.";
  }

  return args;
}

}  // namespace rehearse
