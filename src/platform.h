#pragma once

#include <optional>
#include <string>

namespace rehearse::platform {

bool is_tty();

// Value of an environment variable, nullopt when unset.
std::optional<std::string> get_env(char const *name);

// Set an environment variable unless it is already set.
void set_env_if_unset(char const *name, char const *value);

}  // namespace rehearse::platform
