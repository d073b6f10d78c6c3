#pragma once

// In-memory tracker for unit tests. Only linked into rehearse_tests.

#include "tracker_client.h"

#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rehearse::test {

class fake_tracker : public tracker_client {
 public:
  struct record {
    tracker_ref ref;
    logical_identity identity;
    std::optional<tracker_ref> parent;
  };

  std::optional<tracker_match> find_entity(logical_identity const &identity,
                                           std::optional<tracker_ref> const &parent) override;
  tracker_ref create_entity(entity_definition const &def,
                            std::optional<tracker_ref> const &parent) override;
  void delete_entity(tracker_ref const &ref) override;
  std::vector<tracker_entity> list_children(tracker_ref const &ref) override;
  void attach_field_to_screens(std::string_view field_id,
                               std::string_view project_key) override;
  std::string whoami() override { return "Fake User"; }

  // Insert an entity directly, bypassing counters and failure injection.
  tracker_ref seed(logical_identity const &identity,
                   std::optional<tracker_ref> const &parent = std::nullopt);

  // Failure injection, keyed by canonical identity (create) or ref id (delete).
  void fail_create(std::string canonical);
  void fail_create_transiently(std::string canonical, int times);
  void fail_delete(std::string ref_id);

  std::size_t size() const;
  std::size_t count(logical_identity const &identity) const;
  std::optional<record> lookup(logical_identity const &identity) const;
  std::vector<std::string> call_log() const;  // "create <canonical>", "delete <id>"

  std::atomic_int create_calls{ 0 };
  std::atomic_int delete_calls{ 0 };
  std::atomic_int find_calls{ 0 };
  std::atomic_int list_calls{ 0 };
  std::atomic_int attach_calls{ 0 };

 private:
  tracker_ref insert_unlocked(logical_identity const &identity,
                              std::optional<tracker_ref> const &parent);

  mutable std::mutex mutex_;
  std::map<std::string, record> records_;  // Keyed by ref id
  std::map<std::string, int> next_issue_;  // Per-project issue counter
  std::set<std::string> fail_create_;
  std::map<std::string, int> transient_create_;
  std::set<std::string> fail_delete_;
  std::vector<std::string> log_;
};

}  // namespace rehearse::test
