#include "cmd_teardown.h"

#include "catalog.h"
#include "orchestrator.h"

namespace rehearse {

cmd_teardown::cmd_teardown(cmd_teardown::cfg cfg, config const &env)
    : cfg_{ std::move(cfg) }, env_{ env } {}

bool cmd_teardown::execute() {
  print_banner(cfg_.flags.dry_run);
  print_config_summary(env_);

  auto client{ connect_tracker(env_) };

  // Declining is not a failure.
  if (!confirm_destructive(cfg_.include_projects, cfg_.flags)) { return true; }

  orchestrator orch{ *client, make_orchestrator_options(env_, cfg_.flags) };
  auto const report{ orch.teardown(catalog_project_identities(), cfg_.include_projects) };
  return finish_run(report, cfg_.flags.dry_run);
}

}  // namespace rehearse
