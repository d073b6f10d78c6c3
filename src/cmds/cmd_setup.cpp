#include "cmd_setup.h"

#include "orchestrator.h"
#include "tui.h"

#include <string>

namespace rehearse {

cmd_setup::cmd_setup(cmd_setup::cfg cfg, config const &env)
    : cfg_{ std::move(cfg) }, env_{ env } {}

bool cmd_setup::execute() {
  print_banner(cfg_.flags.dry_run);
  print_config_summary(env_);
  print_data_summary();

  auto client{ connect_tracker(env_) };

  std::string names;
  for (auto const p : cfg_.phases) {
    if (!names.empty()) { names += ", "; }
    names += phase_name(p);
  }
  tui::print_stdout("Phases: %s\n", names.c_str());

  bool const schema{ run_schema_phases(*client, cfg_.phases, cfg_.flags) };

  auto request{ build_setup_request(env_, cfg_.phases) };
  tui::debug("setup: %zu entities, %zu pre-existing",
             request.entities.size(),
             request.pre_existing.size());

  orchestrator orch{ *client, make_orchestrator_options(env_, cfg_.flags) };
  auto const report{ orch.setup(std::move(request.entities), request.pre_existing) };

  bool const ok{ finish_run(report, cfg_.flags.dry_run) };
  return ok && schema && !request.component_source_failed;
}

}  // namespace rehearse
