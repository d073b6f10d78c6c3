#pragma once

#include <istream>
#include <string_view>

namespace rehearse {

inline constexpr char kConfirmDeleteToken[]{ "DELETE" };
inline constexpr char kConfirmYesToken[]{ "yes" };

// Token a destructive operation requires: "DELETE" when projects are removed,
// "yes" otherwise.
std::string_view confirm_token(bool include_projects);

// "DELETE" must match exactly; "yes" matches case-insensitively. Surrounding
// whitespace is ignored.
bool confirm_accepts(std::string_view token, std::string_view input);

// Prompt on stdout and read one line. End of input counts as a refusal.
bool confirm_prompt(std::string_view token, std::istream &in);

}  // namespace rehearse
