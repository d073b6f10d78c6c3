#pragma once

#include "cmd.h"
#include "cmd_common.h"

namespace rehearse {

// --teardown deletes governance issues; --teardown-all also deletes projects.
class cmd_teardown : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_teardown> {
    bool include_projects{ false };
    run_flags flags;
  };

  cmd_teardown(cfg cfg, config const &env);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  config env_;
};

}  // namespace rehearse
