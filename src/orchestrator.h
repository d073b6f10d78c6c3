#pragma once

#include "dependency_graph.h"
#include "dry_run_tracker.h"
#include "entity.h"
#include "planner.h"
#include "resolution_cache.h"
#include "retry.h"
#include "run_report.h"
#include "tracker_client.h"
#include "util.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace rehearse {

struct orchestrator_options {
  bool dry_run{ false };
  int max_concurrency{ 4 };
  retry_policy retry{};
  std::vector<std::string> screen_fields;  // Field ids attached to each project's screens
};

// Drives one invocation: plans levels, resolves parents through the cache,
// creates or deletes entities level by level.
class orchestrator : unmovable {
 public:
  orchestrator(tracker_client &client, orchestrator_options options);

  // Pre-flight errors (cycle, dangling parent, duplicate identity) propagate
  // before any tracker call; per-entity failures land in the report.
  run_report setup(std::vector<entity_definition> entities,
                   std::unordered_set<logical_identity> const &pre_existing);

  // Discover what lives under the given projects and delete it leaves first.
  // Projects themselves are deleted only when include_projects is set.
  run_report teardown(std::vector<logical_identity> const &projects, bool include_projects);

  // Teardown (issues only), then setup; setup starts after teardown finishes.
  run_report rebuild(std::vector<logical_identity> const &projects,
                     std::vector<entity_definition> entities,
                     std::unordered_set<logical_identity> const &pre_existing);

  resolution_cache const &cache() const { return cache_; }

  // Mutations recorded instead of performed; empty for live runs.
  std::vector<std::string> dry_run_operations() const;

 private:
  run_report execute_setup(dependency_graph const &graph);
  entity_outcome setup_entity(entity_definition const &def);
  tracker_ref resolve_parent(logical_identity const &parent);
  void attach_screen_fields(std::string const &project_key);

  struct discovery;
  discovery discover(std::vector<logical_identity> const &projects, run_report &report);

  std::unique_ptr<dry_run_tracker> dry_run_;
  tracker_client &client_;
  orchestrator_options options_;
  resolution_cache cache_;
};

}  // namespace rehearse
