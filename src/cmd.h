#pragma once

#include "config.h"
#include "util.h"

#include <memory>

namespace rehearse {

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // True when every entity the command touched succeeded.
  virtual bool execute() = 0;

  template <typename cmd_config>
  static ptr_t create(cmd_config const &cfg, config const &env);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename cmd_config>
cmd::ptr_t cmd::create(cmd_config const &cfg, config const &env) {
  return std::make_unique<typename cmd_config::cmd_t>(cfg, env);
}

}  // namespace rehearse
