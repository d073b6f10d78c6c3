#include "fake_tracker.h"

#include "errors.h"

namespace rehearse::test {

std::optional<tracker_match> fake_tracker::find_entity(logical_identity const &identity,
                                                       std::optional<tracker_ref> const &) {
  ++find_calls;
  std::lock_guard const lock{ mutex_ };
  for (auto const &[id, rec] : records_) {
    if (rec.identity == identity) { return tracker_match{ rec.ref, rec.parent }; }
  }
  return std::nullopt;
}

tracker_ref fake_tracker::create_entity(entity_definition const &def,
                                        std::optional<tracker_ref> const &parent) {
  ++create_calls;
  auto const identity{ def.identity() };
  auto const canonical{ identity.canonical() };

  std::lock_guard const lock{ mutex_ };
  log_.push_back("create " + canonical);

  if (fail_create_.contains(canonical)) {
    throw validation_error("Rejected by fake tracker: " + canonical);
  }
  if (auto it{ transient_create_.find(canonical) };
      it != transient_create_.end() && it->second > 0) {
    --it->second;
    throw transport_error("Simulated transport failure creating " + canonical);
  }
  if (def.parent && !parent) {
    throw validation_error("Missing parent for " + canonical);
  }
  if (parent && !records_.contains(parent->id)) {
    throw validation_error("Parent " + parent->id + " does not exist");
  }

  return insert_unlocked(identity, parent);
}

void fake_tracker::delete_entity(tracker_ref const &ref) {
  ++delete_calls;
  std::lock_guard const lock{ mutex_ };
  log_.push_back("delete " + ref.id);

  if (fail_delete_.contains(ref.id)) {
    throw validation_error("Rejected delete of " + ref.id);
  }
  if (!records_.contains(ref.id)) { throw validation_error("No such entity " + ref.id); }
  for (auto const &[id, rec] : records_) {
    if (rec.parent && rec.parent->id == ref.id) {
      throw validation_error(ref.id + " still has child " + id);
    }
  }
  records_.erase(ref.id);
}

std::vector<tracker_entity> fake_tracker::list_children(tracker_ref const &ref) {
  ++list_calls;
  std::lock_guard const lock{ mutex_ };
  std::vector<tracker_entity> children;
  for (auto const &[id, rec] : records_) {
    bool const direct{ rec.parent && rec.parent->id == ref.id };
    // A project lists every issue it owns, linked or not.
    bool const owned{ ref.type == entity_type::PROJECT && entity_type_is_issue(rec.ref.type) &&
                      rec.identity.project_key == ref.id };
    if (direct || owned) { children.push_back({ .ref = rec.ref, .name = rec.identity.name }); }
  }
  return children;
}

void fake_tracker::attach_field_to_screens(std::string_view field_id,
                                           std::string_view project_key) {
  ++attach_calls;
  std::lock_guard const lock{ mutex_ };
  log_.push_back("attach " + std::string{ field_id } + " " + std::string{ project_key });
}

tracker_ref fake_tracker::seed(logical_identity const &identity,
                               std::optional<tracker_ref> const &parent) {
  std::lock_guard const lock{ mutex_ };
  return insert_unlocked(identity, parent);
}

void fake_tracker::fail_create(std::string canonical) {
  std::lock_guard const lock{ mutex_ };
  fail_create_.insert(std::move(canonical));
}

void fake_tracker::fail_create_transiently(std::string canonical, int times) {
  std::lock_guard const lock{ mutex_ };
  transient_create_[std::move(canonical)] = times;
}

void fake_tracker::fail_delete(std::string ref_id) {
  std::lock_guard const lock{ mutex_ };
  fail_delete_.insert(std::move(ref_id));
}

std::size_t fake_tracker::size() const {
  std::lock_guard const lock{ mutex_ };
  return records_.size();
}

std::size_t fake_tracker::count(logical_identity const &identity) const {
  std::lock_guard const lock{ mutex_ };
  std::size_t n{ 0 };
  for (auto const &[id, rec] : records_) {
    if (rec.identity == identity) { ++n; }
  }
  return n;
}

std::optional<fake_tracker::record> fake_tracker::lookup(
    logical_identity const &identity) const {
  std::lock_guard const lock{ mutex_ };
  for (auto const &[id, rec] : records_) {
    if (rec.identity == identity) { return rec; }
  }
  return std::nullopt;
}

std::vector<std::string> fake_tracker::call_log() const {
  std::lock_guard const lock{ mutex_ };
  return log_;
}

tracker_ref fake_tracker::insert_unlocked(logical_identity const &identity,
                                          std::optional<tracker_ref> const &parent) {
  std::string id{ identity.project_key };
  if (identity.type != entity_type::PROJECT) {
    id += "-" + std::to_string(++next_issue_[identity.project_key]);
  }
  tracker_ref ref{ .type = identity.type, .id = id };
  records_[id] = record{ .ref = ref, .identity = identity, .parent = parent };
  return ref;
}

}  // namespace rehearse::test
