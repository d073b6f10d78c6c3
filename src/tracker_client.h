#pragma once

#include "entity.h"
#include "util.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

// Opaque tracker identifier: a project key, issue key, version id...
struct tracker_ref {
  entity_type type;
  std::string id;

  bool operator==(tracker_ref const &other) const = default;
};

struct tracker_match {
  tracker_ref ref;
  std::optional<tracker_ref> parent;  // Parent as the tracker currently records it
};

struct tracker_entity {
  tracker_ref ref;
  std::string name;
};

// Remote issue tracker. Every operation may throw transport_error,
// rate_limit_error or validation_error; implementations must be callable
// concurrently from worker threads.
class tracker_client : unmovable {
 public:
  virtual ~tracker_client() = default;

  // Look up an entity by logical identity, scoped to its parent when given.
  virtual std::optional<tracker_match> find_entity(
      logical_identity const &identity,
      std::optional<tracker_ref> const &parent) = 0;

  virtual tracker_ref create_entity(entity_definition const &def,
                                    std::optional<tracker_ref> const &parent) = 0;

  virtual void delete_entity(tracker_ref const &ref) = 0;

  // Direct children in the governance structure.
  virtual std::vector<tracker_entity> list_children(tracker_ref const &ref) = 0;

  virtual void attach_field_to_screens(std::string_view field_id,
                                       std::string_view project_key) = 0;

  // Display name of the authenticated account.
  virtual std::string whoami() = 0;

 protected:
  tracker_client() = default;
};

}  // namespace rehearse
