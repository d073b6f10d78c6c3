#pragma once

#include "entity.h"
#include "errors.h"
#include "tracker_client.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rehearse {

enum class outcome_status { CREATED, SKIPPED_EXISTING, FAILED, DELETED };

std::string_view outcome_status_name(outcome_status status);

struct entity_outcome {
  logical_identity identity;
  std::optional<tracker_ref> ref;
  outcome_status status;
  std::optional<error_kind> error;
  std::string reason;
};

struct type_counts {
  std::size_t created{ 0 };
  std::size_t skipped{ 0 };
  std::size_t failed{ 0 };
  std::size_t deleted{ 0 };
};

// Outcomes of one invocation, in plan order.
class run_report {
 public:
  void add(entity_outcome outcome);
  void append(run_report const &other);

  std::vector<entity_outcome> const &outcomes() const { return outcomes_; }
  type_counts counts(entity_type type) const;
  type_counts totals() const;

  std::size_t failed_count() const;
  bool ok() const { return failed_count() == 0; }

  // Count table per entity type, then one line per failure.
  std::string render_summary(bool dry_run) const;

 private:
  std::vector<entity_outcome> outcomes_;
};

}  // namespace rehearse
