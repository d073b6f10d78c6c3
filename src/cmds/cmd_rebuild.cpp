#include "cmd_rebuild.h"

#include "catalog.h"
#include "orchestrator.h"
#include "tui.h"

namespace rehearse {

cmd_rebuild::cmd_rebuild(cmd_rebuild::cfg cfg, config const &env)
    : cfg_{ std::move(cfg) }, env_{ env } {}

bool cmd_rebuild::execute() {
  print_banner(cfg_.flags.dry_run);
  print_config_summary(env_);
  print_data_summary();

  auto client{ connect_tracker(env_) };
  if (!confirm_destructive(false, cfg_.flags)) { return true; }

  auto request{ build_setup_request(env_, all_phases()) };

  // Instance-wide schema; teardown leaves it alone.
  bool const schema{ run_schema_phases(*client, all_phases(), cfg_.flags) };

  orchestrator orch{ *client, make_orchestrator_options(env_, cfg_.flags) };
  auto const report{ orch.rebuild(catalog_project_identities(),
                                  std::move(request.entities),
                                  request.pre_existing) };

  bool const ok{ finish_run(report, cfg_.flags.dry_run) };
  return ok && schema && !request.component_source_failed;
}

}  // namespace rehearse
