#include "cmd_test_connection.h"

#include "cmd_common.h"
#include "tui.h"

namespace rehearse {

cmd_test_connection::cmd_test_connection(cmd_test_connection::cfg cfg, config const &env)
    : cfg_{ cfg }, env_{ env } {}

bool cmd_test_connection::execute() {
  print_banner(false);
  print_config_summary(env_);

  connect_tracker(env_);
  tui::print_stdout("Connection test successful!\n");
  return true;
}

}  // namespace rehearse
