#pragma once

#include <concepts>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

struct file_deleter {
  void operator()(std::FILE *f) const noexcept {
    if (f) { std::fclose(f); }
  }
};

using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load an entire text file. Throws std::runtime_error if it cannot be opened or read.
std::string util_load_text_file(std::filesystem::path const &path);

// Strip leading and trailing spaces, tabs, CR and LF.
std::string util_trim(std::string_view s);

// Split on commas, trimming each token and dropping empty tokens.
// Example: " a, b,,c " -> {"a", "b", "c"}
std::vector<std::string> util_split_csv(std::string_view s);

std::string util_to_lower(std::string_view s);

// Shorten to at most max_chars, appending "..." when truncated.
std::string util_ellipsize(std::string_view s, std::size_t max_chars);

}  // namespace rehearse
