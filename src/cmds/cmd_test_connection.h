#pragma once

#include "cmd.h"

namespace rehearse {

class cmd_test_connection : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_test_connection> {};

  cmd_test_connection(cfg cfg, config const &env);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  config env_;
};

}  // namespace rehearse
