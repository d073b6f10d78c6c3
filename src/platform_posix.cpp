#include "platform.h"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include <unistd.h>

namespace rehearse::platform {

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

std::optional<std::string> get_env(char const *name) {
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

void set_env_if_unset(char const *name, char const *value) {
  if (::setenv(name, value, 0) != 0) {
    throw std::runtime_error(std::string{ "setenv failed for " } + name);
  }
}

}  // namespace rehearse::platform
