#include "confirm.h"

#include "tui.h"
#include "util.h"

#include <string>

namespace rehearse {

std::string_view confirm_token(bool include_projects) {
  return include_projects ? kConfirmDeleteToken : kConfirmYesToken;
}

bool confirm_accepts(std::string_view token, std::string_view input) {
  auto const answer{ util_trim(input) };
  if (token == kConfirmYesToken) { return util_to_lower(answer) == kConfirmYesToken; }
  return answer == token;
}

bool confirm_prompt(std::string_view token, std::istream &in) {
  tui::interactive_mode_guard const guard;
  tui::print_stdout("\nType '%.*s' to confirm: ", static_cast<int>(token.size()), token.data());

  std::string line;
  if (!std::getline(in, line)) { return false; }
  return confirm_accepts(token, line);
}

}  // namespace rehearse
