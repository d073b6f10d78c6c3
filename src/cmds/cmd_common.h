#pragma once

#include "catalog.h"
#include "config.h"
#include "entity.h"
#include "jira_client.h"
#include "orchestrator.h"
#include "run_report.h"
#include "schema.h"

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace rehearse {

// Flags shared by every command that talks to the tracker.
struct run_flags {
  bool dry_run{ false };
  bool force{ false };
  int concurrency{ 4 };
};

void print_banner(bool dry_run);
void print_config_summary(config const &cfg);
void print_data_summary();

// Validates the Jira settings, then proves them with a /myself call.
std::unique_ptr<jira_client> connect_tracker(config const &cfg);

orchestrator_options make_orchestrator_options(config const &cfg, run_flags const &flags);

struct setup_request {
  std::vector<entity_definition> entities;
  std::unordered_set<logical_identity> pre_existing;
  bool component_source_failed{ false };
};

// Catalog entities of the selected phases. Component mappings are read from the
// database only when that phase is selected; a database failure is logged and
// leaves the phase empty.
setup_request build_setup_request(config const &cfg, std::vector<phase> const &phases);

// Issue type and custom field phases, when selected. Prints their summary;
// true when nothing failed.
bool run_schema_phases(schema_admin &admin,
                       std::vector<phase> const &phases,
                       run_flags const &flags);

// Prints the outcome table and the dry-run footer; true when nothing failed.
bool finish_run(run_report const &report, bool dry_run);

// Destructive-operation confirmation; skipped for --force and --dry-run.
bool confirm_destructive(bool include_projects, run_flags const &flags);

}  // namespace rehearse
