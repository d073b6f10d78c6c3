#include "config.h"

#include "platform.h"
#include "util.h"

#include <stdexcept>
#include <utility>

namespace rehearse {

namespace {

void apply(env_lookup_t const &lookup, char const *name, std::string &out) {
  if (auto value{ lookup(name) }) { out = std::move(*value); }
}

std::string strip_quotes(std::string value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

config config_from_env(env_lookup_t const &lookup) {
  config cfg;
  apply(lookup, "JIRA_URL", cfg.jira.base_url);
  apply(lookup, "JIRA_USER", cfg.jira.user);
  apply(lookup, "JIRA_TOKEN", cfg.jira.token);
  if (auto verify{ lookup("JIRA_VERIFY_SSL") }) {
    cfg.jira.verify_ssl = util_to_lower(util_trim(*verify)) == "true";
  }
  if (auto fields{ lookup("JIRA_SCREEN_FIELDS") }) { cfg.screen_fields = util_split_csv(*fields); }

  apply(lookup, "DB_HOST", cfg.db.host);
  apply(lookup, "DB_PORT", cfg.db.port);
  apply(lookup, "DB_NAME", cfg.db.name);
  apply(lookup, "DB_USER", cfg.db.user);
  apply(lookup, "DB_PASSWORD", cfg.db.password);
  return cfg;
}

std::map<std::string, std::string> config_parse_dotenv(std::string_view content) {
  std::map<std::string, std::string> out;
  for (std::string_view sv{ content }; !sv.empty();) {
    auto const eol{ sv.find('\n') };
    auto line{ util_trim(sv.substr(0, eol)) };
    sv = (eol == std::string_view::npos) ? std::string_view{} : sv.substr(eol + 1);

    if (line.empty() || line.front() == '#') { continue; }
    if (line.starts_with("export ")) { line = util_trim(std::string_view{ line }.substr(7)); }

    auto const eq{ line.find('=') };
    if (eq == std::string::npos || eq == 0) { continue; }
    auto key{ util_trim(std::string_view{ line }.substr(0, eq)) };
    auto value{ strip_quotes(util_trim(std::string_view{ line }.substr(eq + 1))) };
    out[std::move(key)] = std::move(value);
  }
  return out;
}

bool config_load_dotenv(std::filesystem::path const &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) { return false; }

  for (auto const &[key, value] : config_parse_dotenv(util_load_text_file(path))) {
    platform::set_env_if_unset(key.c_str(), value.c_str());
  }
  return true;
}

void config_validate(config const &cfg) {
  auto const require{ [](std::string const &value, char const *name, char const *what) {
    if (value.empty()) {
      throw std::runtime_error(std::string{ "Missing required environment variable: " } + name +
                               " (" + what + "). Set it in the environment or in .env");
    }
  } };
  require(cfg.jira.base_url, "JIRA_URL", "Jira Data Center base URL");
  require(cfg.jira.user, "JIRA_USER", "Jira username");
  require(cfg.jira.token, "JIRA_TOKEN", "Personal Access Token");
}

std::string config_mask_token(std::string_view token) {
  if (token.size() <= 8) { return "NOT SET"; }
  return std::string{ token.substr(0, 8) } + "...";
}

std::vector<std::string> config_describe(config const &cfg) {
  auto const or_unset{ [](std::string const &v) { return v.empty() ? std::string{ "NOT SET" } : v; } };

  std::string fields;
  for (auto const &f : cfg.screen_fields) { fields += (fields.empty() ? "" : ", ") + f; }

  return { "  JIRA_URL:        " + or_unset(cfg.jira.base_url),
           "  JIRA_USER:       " + or_unset(cfg.jira.user),
           "  JIRA_TOKEN:      " + config_mask_token(cfg.jira.token),
           std::string{ "  JIRA_VERIFY_SSL: " } + (cfg.jira.verify_ssl ? "true" : "false"),
           "  SCREEN_FIELDS:   " + (fields.empty() ? std::string{ "(none)" } : fields),
           "  DATABASE:        " + cfg.db.user + "@" + cfg.db.host + ":" + cfg.db.port + "/" +
               cfg.db.name };
}

}  // namespace rehearse
