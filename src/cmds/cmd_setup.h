#pragma once

#include "catalog.h"
#include "cmd.h"
#include "cmd_common.h"

#include <vector>

namespace rehearse {

class cmd_setup : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_setup> {
    std::vector<phase> phases;  // Execution order; --all selects every phase
    run_flags flags;
  };

  cmd_setup(cfg cfg, config const &env);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  config env_;
};

}  // namespace rehearse
