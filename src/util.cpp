#include "util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rehearse {

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_text_file: failed to open file: " + path.string());
  }

  std::string content;
  char buf[4096];
  for (;;) {
    std::size_t const n{ std::fread(buf, 1, sizeof(buf), file.get()) };
    content.append(buf, n);
    if (n < sizeof(buf)) { break; }
  }
  if (std::ferror(file.get())) {
    throw std::runtime_error("util_load_text_file: failed to read file: " + path.string());
  }
  return content;
}

std::string util_trim(std::string_view s) {
  auto const is_space{ [](char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
  } };

  while (!s.empty() && is_space(s.front())) { s.remove_prefix(1); }
  while (!s.empty() && is_space(s.back())) { s.remove_suffix(1); }
  return std::string{ s };
}

std::vector<std::string> util_split_csv(std::string_view s) {
  std::vector<std::string> tokens;
  for (std::string_view sv{ s }; !sv.empty();) {
    auto const pos{ sv.find(',') };
    auto token{ util_trim(sv.substr(0, pos)) };
    if (!token.empty()) { tokens.push_back(std::move(token)); }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }
  return tokens;
}

std::string util_to_lower(std::string_view s) {
  std::string result{ s };
  std::ranges::transform(result, result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

std::string util_ellipsize(std::string_view s, std::size_t max_chars) {
  if (s.size() <= max_chars) { return std::string{ s }; }
  if (max_chars <= 3) { return std::string(max_chars, '.'); }
  return std::string{ s.substr(0, max_chars - 3) } + "...";
}

}  // namespace rehearse
