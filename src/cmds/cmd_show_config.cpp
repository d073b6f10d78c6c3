#include "cmd_show_config.h"

#include "cmd_common.h"

namespace rehearse {

cmd_show_config::cmd_show_config(cmd_show_config::cfg cfg, config const &env)
    : cfg_{ cfg }, env_{ env } {}

bool cmd_show_config::execute() {
  print_banner(false);
  print_config_summary(env_);
  print_data_summary();
  return true;
}

}  // namespace rehearse
