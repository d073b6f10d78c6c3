#include "resolution_cache.h"

#include <doctest/doctest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace rehearse {

namespace {

logical_identity objective(std::string name) {
  return { entity_type::STRATEGIC_OBJECTIVE, std::move(name), "DEVEX" };
}

}  // namespace

TEST_CASE("resolution_cache: insert then find") {
  resolution_cache cache;
  CHECK_FALSE(cache.find(objective("A")).has_value());

  CHECK(cache.insert({ objective("A"), { entity_type::STRATEGIC_OBJECTIVE, "DEVEX-1" }, true }));

  auto const hit{ cache.find(objective("A")) };
  REQUIRE(hit.has_value());
  CHECK(hit->ref.id == "DEVEX-1");
  CHECK(hit->created_this_run);
  CHECK(cache.size() == 1);
}

TEST_CASE("resolution_cache: first writer wins") {
  resolution_cache cache;
  CHECK(cache.insert({ objective("A"), { entity_type::STRATEGIC_OBJECTIVE, "DEVEX-1" }, true }));
  CHECK_FALSE(
      cache.insert({ objective("A"), { entity_type::STRATEGIC_OBJECTIVE, "DEVEX-9" }, false }));

  auto const hit{ cache.find(objective("A")) };
  REQUIRE(hit.has_value());
  CHECK(hit->ref.id == "DEVEX-1");
}

TEST_CASE("resolution_cache: concurrent inserts of one identity keep a single entry") {
  resolution_cache cache;
  std::atomic_int winners{ 0 };
  std::vector<std::thread> threads;
  for (int i{ 0 }; i < 8; ++i) {
    threads.emplace_back([&, i] {
      tracker_ref ref{ entity_type::STRATEGIC_OBJECTIVE, "DEVEX-" + std::to_string(i) };
      if (cache.insert({ objective("shared"), ref, true })) { ++winners; }
    });
  }
  for (auto &t : threads) { t.join(); }

  CHECK(winners.load() == 1);
  CHECK(cache.size() == 1);
}

TEST_CASE("resolution_cache: failures tracked separately") {
  resolution_cache cache;
  cache.mark_failed(objective("B"));
  CHECK(cache.failed(objective("B")));
  CHECK_FALSE(cache.failed(objective("A")));
  CHECK(cache.size() == 0);
}

}  // namespace rehearse
