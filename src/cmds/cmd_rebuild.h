#pragma once

#include "cmd.h"
#include "cmd_common.h"

namespace rehearse {

// Delete every governance issue (projects stay), then run all setup phases.
class cmd_rebuild : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_rebuild> {
    run_flags flags;
  };

  cmd_rebuild(cfg cfg, config const &env);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  config env_;
};

}  // namespace rehearse
