#pragma once

#include "cmds/cmd_rebuild.h"
#include "cmds/cmd_setup.h"
#include "cmds/cmd_show_config.h"
#include "cmds/cmd_teardown.h"
#include "cmds/cmd_test_connection.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rehearse {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_setup::cfg,
                                 cmd_teardown::cfg,
                                 cmd_rebuild::cfg,
                                 cmd_show_config::cfg,
                                 cmd_test_connection::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
  bool help_requested{ false };  // --help: cli_output holds the help text
};

cli_args cli_parse(int argc, char **argv);

}  // namespace rehearse
