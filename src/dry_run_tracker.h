#pragma once

#include "tracker_client.h"

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace rehearse {

// Wraps a tracker client so that reads pass through and mutations are
// recorded instead of performed. Created entities get a synthesized ref
// "dry-run:<canonical identity>"; reads against such refs stay local.
// Entities deleted during the simulation are hidden from later reads so a
// simulated rebuild recreates them.
class dry_run_tracker : public tracker_client {
 public:
  explicit dry_run_tracker(tracker_client &inner);

  std::optional<tracker_match> find_entity(logical_identity const &identity,
                                           std::optional<tracker_ref> const &parent) override;
  tracker_ref create_entity(entity_definition const &def,
                            std::optional<tracker_ref> const &parent) override;
  void delete_entity(tracker_ref const &ref) override;
  std::vector<tracker_entity> list_children(tracker_ref const &ref) override;
  void attach_field_to_screens(std::string_view field_id,
                               std::string_view project_key) override;
  std::string whoami() override;

  // "create <canonical>", "delete <ref>", "attach <field> <project>"
  std::vector<std::string> operations() const;

  static bool is_synthetic(tracker_ref const &ref);

 private:
  void record(std::string op);
  bool deleted(tracker_ref const &ref) const;

  tracker_client &inner_;
  mutable std::mutex mutex_;
  std::vector<std::string> operations_;
  std::unordered_set<std::string> deleted_ids_;
};

}  // namespace rehearse
