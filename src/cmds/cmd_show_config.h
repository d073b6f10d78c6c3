#pragma once

#include "cmd.h"

namespace rehearse {

class cmd_show_config : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_show_config> {};

  cmd_show_config(cfg cfg, config const &env);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  config env_;
};

}  // namespace rehearse
