#include "cli.h"
#include "cmd.h"
#include "config.h"
#include "platform.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  rehearse::tui::init();

  auto args{ rehearse::cli_parse(argc, argv) };
  rehearse::tui::configure_trace_outputs(args.trace_outputs);
  rehearse::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (args.help_requested) {
    rehearse::tui::print_stdout("%s", args.cli_output.c_str());
    return EXIT_SUCCESS;
  }

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      rehearse::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    rehearse::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  bool ok{ false };
  try {
    if (rehearse::config_load_dotenv(".env")) { rehearse::tui::debug("Loaded .env"); }
    auto const env{ rehearse::config_from_env(
        [](char const *name) { return rehearse::platform::get_env(name); }) };

    auto cmd{ std::visit([&env](auto const &cfg) { return rehearse::cmd::create(cfg, env); },
                         *args.cmd_cfg) };
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    rehearse::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
