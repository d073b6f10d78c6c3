#include "util.h"

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("rehearse-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("match with std::variant of int and string") {
  using var_t = std::variant<int, std::string>;

  var_t v1{ 42 };
  var_t v2{ std::string("hello") };

  auto const visitor{ rehearse::match{
      [](int x) { return x * 2; },
      [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, v1) == 84);
  CHECK(std::visit(visitor, v2) == 5);
}

TEST_CASE("match with void return") {
  using var_t = std::variant<int, std::string>;

  int int_count{};
  int string_count{};

  auto counter{ rehearse::match{ [&](int) { ++int_count; },
                                 [&](std::string const &) { ++string_count; } } };

  std::visit(counter, var_t{ 1 });
  std::visit(counter, var_t{ std::string("x") });
  std::visit(counter, var_t{ 2 });

  CHECK(int_count == 2);
  CHECK(string_count == 1);
}

TEST_CASE("util_trim strips surrounding whitespace") {
  CHECK(rehearse::util_trim("  a b \t\r\n") == "a b");
  CHECK(rehearse::util_trim("") == "");
  CHECK(rehearse::util_trim(" \t ") == "");
}

TEST_CASE("util_split_csv trims and drops empty tokens") {
  CHECK(rehearse::util_split_csv(" a, b,,c ") == std::vector<std::string>{ "a", "b", "c" });
  CHECK(rehearse::util_split_csv("").empty());
  CHECK(rehearse::util_split_csv("customfield_10212") ==
        std::vector<std::string>{ "customfield_10212" });
}

TEST_CASE("util_to_lower") {
  CHECK(rehearse::util_to_lower("YeS") == "yes");
}

TEST_CASE("util_ellipsize") {
  CHECK(rehearse::util_ellipsize("short", 10) == "short");
  CHECK(rehearse::util_ellipsize("abcdefghij", 6) == "abc...");
  CHECK(rehearse::util_ellipsize("abcdef", 2) == "..");
}

TEST_CASE("util_load_text_file reads whole file") {
  auto const path{ make_temp_path("text") };
  std::string expected;
  for (int i{ 0 }; i < 2000; ++i) { expected += "line " + std::to_string(i) + "\n"; }
  {
    std::ofstream out{ path, std::ios::binary };
    out << expected;
  }

  CHECK(rehearse::util_load_text_file(path) == expected);
  std::filesystem::remove(path);
}

TEST_CASE("util_load_text_file throws on nonexistent file") {
  auto const path{ make_temp_path("missing") };
  CHECK_THROWS_WITH(rehearse::util_load_text_file(path), doctest::Contains("failed to open file"));
}
