#pragma once

#include "component_mapping.h"
#include "jira_client.h"

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

struct config {
  jira_settings jira;
  db_settings db;
  std::vector<std::string> screen_fields;  // JIRA_SCREEN_FIELDS
};

using env_lookup_t = std::function<std::optional<std::string>(char const *)>;

// Build from environment variables. Missing values keep their defaults.
config config_from_env(env_lookup_t const &lookup);

// KEY=VALUE lines; blank lines and '#' comments skipped, optional "export "
// prefix and matching single or double quotes stripped.
std::map<std::string, std::string> config_parse_dotenv(std::string_view content);

// Copy a .env file into the process environment without overriding variables
// that are already set. Returns false when the file does not exist.
bool config_load_dotenv(std::filesystem::path const &path);

// Throws std::runtime_error naming the first missing Jira setting.
void config_validate(config const &cfg);

// "abcdefgh..." for tokens longer than eight characters, else "NOT SET".
std::string config_mask_token(std::string_view token);

// Human-readable summary, one line per entry. The token is masked.
std::vector<std::string> config_describe(config const &cfg);

}  // namespace rehearse
