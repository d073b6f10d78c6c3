#include "dry_run_tracker.h"

#include "tui.h"

#include <algorithm>

namespace rehearse {

namespace {

constexpr std::string_view kSyntheticPrefix{ "dry-run:" };

std::string ref_key(tracker_ref const &ref) {
  return std::string{ entity_type_name(ref.type) } + ":" + ref.id;
}

}  // namespace

dry_run_tracker::dry_run_tracker(tracker_client &inner) : inner_{ inner } {}

bool dry_run_tracker::is_synthetic(tracker_ref const &ref) {
  return ref.id.starts_with(kSyntheticPrefix);
}

std::optional<tracker_match> dry_run_tracker::find_entity(
    logical_identity const &identity,
    std::optional<tracker_ref> const &parent) {
  // Nothing can exist beneath an entity that was never really created.
  if (parent && is_synthetic(*parent)) { return std::nullopt; }

  auto match{ inner_.find_entity(identity, parent) };
  if (match && deleted(match->ref)) { return std::nullopt; }
  return match;
}

tracker_ref dry_run_tracker::create_entity(entity_definition const &def,
                                           std::optional<tracker_ref> const &) {
  auto const canonical{ def.identity().canonical() };
  record("create " + canonical);
  tui::info("[DRY RUN] Would create %s", canonical.c_str());
  return tracker_ref{ .type = def.type, .id = std::string{ kSyntheticPrefix } + canonical };
}

void dry_run_tracker::delete_entity(tracker_ref const &ref) {
  {
    std::lock_guard const lock{ mutex_ };
    operations_.push_back("delete " + ref.id);
    deleted_ids_.insert(ref_key(ref));
  }
  tui::info("[DRY RUN] Would delete %s %s",
            std::string{ entity_type_name(ref.type) }.c_str(),
            ref.id.c_str());
}

std::vector<tracker_entity> dry_run_tracker::list_children(tracker_ref const &ref) {
  if (is_synthetic(ref)) { return {}; }

  auto children{ inner_.list_children(ref) };
  std::erase_if(children, [this](tracker_entity const &c) { return deleted(c.ref); });
  return children;
}

void dry_run_tracker::attach_field_to_screens(std::string_view field_id,
                                              std::string_view project_key) {
  record("attach " + std::string{ field_id } + " " + std::string{ project_key });
}

std::string dry_run_tracker::whoami() { return inner_.whoami(); }

std::vector<std::string> dry_run_tracker::operations() const {
  std::lock_guard const lock{ mutex_ };
  return operations_;
}

void dry_run_tracker::record(std::string op) {
  std::lock_guard const lock{ mutex_ };
  operations_.push_back(std::move(op));
}

bool dry_run_tracker::deleted(tracker_ref const &ref) const {
  std::lock_guard const lock{ mutex_ };
  return deleted_ids_.contains(ref_key(ref));
}

}  // namespace rehearse
