#include "orchestrator.h"

#include "dependency_graph.h"
#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <utility>

namespace rehearse {

namespace {

std::string describe_ref(tracker_ref const &ref) {
  return std::string{ entity_type_name(ref.type) } + " " + ref.id;
}

entity_outcome failed_outcome(logical_identity identity,
                              std::optional<tracker_ref> ref,
                              std::exception const &ex) {
  auto const kind{ classify_error(ex) };
  REHEARSE_TRACE_ENTITY_FAILED(identity.canonical(),
                               std::string{ error_kind_name(kind) },
                               std::string{ ex.what() });
  tui::error("Failed %s: %s", identity.canonical().c_str(), ex.what());
  return entity_outcome{ .identity = std::move(identity),
                         .ref = std::move(ref),
                         .status = outcome_status::FAILED,
                         .error = kind,
                         .reason = ex.what() };
}

// Run body(i) for i in [0, n) on an arena bounded by max_concurrency.
template <typename Body>
void run_bounded(int max_concurrency, std::size_t n, Body &&body) {
  if (n == 0) { return; }
  tbb::task_arena arena{ std::max(1, max_concurrency) };
  arena.execute([&] {
    tbb::parallel_for(tbb::blocked_range<std::size_t>{ 0, n },
                      [&](tbb::blocked_range<std::size_t> const &r) {
                        for (std::size_t i{ r.begin() }; i != r.end(); ++i) { body(i); }
                      });
  });
}

bool is_teardown_child(tracker_entity const &e) {
  return entity_type_is_issue(e.ref.type);
}

}  // namespace

struct orchestrator::discovery {
  std::vector<discovered_node> nodes;
  std::vector<std::string> project_keys;  // Owning project per node
  std::vector<std::optional<std::pair<error_kind, std::string>>> errors;
};

orchestrator::orchestrator(tracker_client &client, orchestrator_options options)
    : dry_run_{ options.dry_run ? std::make_unique<dry_run_tracker>(client) : nullptr },
      client_{ dry_run_ ? static_cast<tracker_client &>(*dry_run_) : client },
      options_{ std::move(options) } {}

std::vector<std::string> orchestrator::dry_run_operations() const {
  return dry_run_ ? dry_run_->operations() : std::vector<std::string>{};
}

run_report orchestrator::setup(std::vector<entity_definition> entities,
                               std::unordered_set<logical_identity> const &pre_existing) {
  return execute_setup(dependency_graph_build(std::move(entities), pre_existing));
}

run_report orchestrator::execute_setup(dependency_graph const &graph) {
  auto const plan{ planner_build_run_plan(graph) };

  tui::info("%sSetup: %zu entities in %zu levels",
            options_.dry_run ? "[DRY RUN] " : "",
            plan.entity_count(),
            plan.levels.size());

  run_report report;
  for (std::size_t level{ 0 }; level < plan.levels.size(); ++level) {
    auto const &indices{ plan.levels[level] };
    level_trace_scope const trace_scope{ "setup",
                                         static_cast<std::int64_t>(level),
                                         static_cast<std::int64_t>(indices.size()) };
    tui::debug("Setup level %zu: %zu entities", level, indices.size());

    std::vector<std::optional<entity_outcome>> results(indices.size());
    run_bounded(options_.max_concurrency, indices.size(), [&](std::size_t i) {
      results[i] = setup_entity(graph.entities[indices[i]]);
    });

    for (auto &r : results) {
      if (r) { report.add(std::move(*r)); }
    }
  }

  return report;
}

entity_outcome orchestrator::setup_entity(entity_definition const &def) {
  auto identity{ def.identity() };
  auto const canonical{ identity.canonical() };

  try {
    std::optional<tracker_ref> parent;
    if (auto const parent_id{ def.parent_identity() }) {
      parent = resolve_parent(*parent_id);
    }

    auto const existing{ retry_call(options_.retry, "find " + canonical, [&] {
      return client_.find_entity(identity, parent);
    }) };

    entity_outcome outcome{ .identity = identity, .ref = std::nullopt };
    if (existing) {
      if (parent && !existing->parent) {
        throw validation_error(canonical + " already exists without a parent link, expected " +
                               describe_ref(*parent));
      }
      if (parent && !(*existing->parent == *parent)) {
        throw validation_error(canonical + " already exists under " +
                               describe_ref(*existing->parent) + ", expected " +
                               describe_ref(*parent));
      }
      cache_.insert({ .identity = identity, .ref = existing->ref, .created_this_run = false });
      REHEARSE_TRACE_ENTITY_SKIPPED(canonical, existing->ref.id);
      tui::info("Exists %s (%s)", canonical.c_str(), existing->ref.id.c_str());
      outcome.ref = existing->ref;
      outcome.status = outcome_status::SKIPPED_EXISTING;
    } else {
      auto const ref{ retry_call(options_.retry, "create " + canonical, [&] {
        return client_.create_entity(def, parent);
      }) };
      cache_.insert({ .identity = identity, .ref = ref, .created_this_run = true });
      REHEARSE_TRACE_ENTITY_CREATED(canonical, ref.id, options_.dry_run);
      tui::info("Created %s (%s)", canonical.c_str(), ref.id.c_str());
      outcome.ref = ref;
      outcome.status = outcome_status::CREATED;
    }

    if (def.type == entity_type::PROJECT) { attach_screen_fields(def.project_key); }
    return outcome;
  } catch (std::exception const &ex) {
    cache_.mark_failed(identity);
    return failed_outcome(std::move(identity), std::nullopt, ex);
  }
}

tracker_ref orchestrator::resolve_parent(logical_identity const &parent) {
  auto const canonical{ parent.canonical() };
  if (cache_.failed(parent)) {
    throw unresolved_parent_error("Parent " + canonical + " failed earlier in this run");
  }

  if (auto const hit{ cache_.find(parent) }) {
    REHEARSE_TRACE_ENTITY_RESOLVED(canonical, hit->ref.id, true);
    return hit->ref;
  }

  // Pre-existing parent: not provisioned by this run, look it up.
  auto const found{ retry_call(options_.retry, "find " + canonical, [&] {
    return client_.find_entity(parent, std::nullopt);
  }) };
  if (!found) {
    throw unresolved_parent_error("Parent " + canonical + " was not found in the tracker");
  }

  cache_.insert({ .identity = parent, .ref = found->ref, .created_this_run = false });
  REHEARSE_TRACE_ENTITY_RESOLVED(canonical, found->ref.id, false);
  return found->ref;
}

void orchestrator::attach_screen_fields(std::string const &project_key) {
  for (auto const &field : options_.screen_fields) {
    try {
      retry_call(options_.retry, "attach " + field + " to " + project_key, [&] {
        client_.attach_field_to_screens(field, project_key);
      });
      tui::debug("Attached %s to %s screens", field.c_str(), project_key.c_str());
    } catch (std::exception const &ex) {
      tui::warn("Could not attach %s to %s screens: %s",
                field.c_str(),
                project_key.c_str(),
                ex.what());
    }
  }
}

orchestrator::discovery orchestrator::discover(std::vector<logical_identity> const &projects,
                                               run_report &report) {
  discovery d;
  std::unordered_map<std::string, std::size_t> index_of;
  std::deque<std::size_t> queue;

  auto const add_node{ [&](tracker_entity entity, std::string const &project_key) {
    auto const [it, inserted]{ index_of.emplace(
        std::string{ entity_type_name(entity.ref.type) } + ":" + entity.ref.id,
        d.nodes.size()) };
    if (inserted) {
      d.nodes.push_back({ .entity = std::move(entity), .children = {} });
      d.project_keys.push_back(project_key);
      d.errors.emplace_back();
      queue.push_back(it->second);
    }
    return it->second;
  } };

  for (auto const &project : projects) {
    try {
      auto const found{ retry_call(options_.retry, "find " + project.canonical(), [&] {
        return client_.find_entity(project, std::nullopt);
      }) };
      if (!found) {
        tui::info("Project %s not found; nothing to tear down", project.project_key.c_str());
        continue;
      }
      add_node({ .ref = found->ref, .name = project.name }, project.project_key);
    } catch (std::exception const &ex) {
      report.add(failed_outcome(project, std::nullopt, ex));
    }
  }

  while (!queue.empty()) {
    auto const idx{ queue.front() };
    queue.pop_front();
    auto const ref{ d.nodes[idx].entity.ref };
    auto const project_key{ d.project_keys[idx] };

    try {
      auto const children{ retry_call(options_.retry, "list children of " + ref.id, [&] {
        return client_.list_children(ref);
      }) };
      for (auto const &child : children) {
        if (!is_teardown_child(child)) { continue; }
        auto const child_idx{ add_node(child, project_key) };
        if (child_idx == idx) { continue; }
        auto &kids{ d.nodes[idx].children };
        if (std::ranges::find(kids, child_idx) == kids.end()) { kids.push_back(child_idx); }
      }
    } catch (std::exception const &ex) {
      d.errors[idx] = std::make_pair(classify_error(ex), std::string{ ex.what() });
    }
  }

  return d;
}

run_report orchestrator::teardown(std::vector<logical_identity> const &projects,
                                  bool include_projects) {
  run_report report;
  auto d{ discover(projects, report) };

  auto const project_keys{ std::move(d.project_keys) };
  auto const errors{ std::move(d.errors) };
  auto const plan{ planner_build_teardown_plan(std::move(d.nodes)) };

  tui::info("%sTeardown: %zu live entities in %zu levels",
            options_.dry_run ? "[DRY RUN] " : "",
            plan.nodes.size(),
            plan.levels.size());

  enum class node_state : unsigned char { PENDING, DELETED, LEFT };
  std::vector<node_state> state(plan.nodes.size(), node_state::PENDING);
  std::unordered_set<std::string> deleted_ids;

  auto const identity_of{ [&](std::size_t idx) {
    auto const &e{ plan.nodes[idx].entity };
    return logical_identity{ .type = e.ref.type, .name = e.name, .project_key = project_keys[idx] };
  } };

  struct attempt {
    std::optional<entity_outcome> outcome;  // Empty when deferred
    std::size_t live_children{ 0 };
  };

  // Delete idx if nothing that was not deleted this run still hangs below it.
  auto const try_delete{ [&](std::size_t idx, bool final_check) -> attempt {
    auto const &ref{ plan.nodes[idx].entity.ref };
    try {
      if (errors[idx]) {
        throw rehearse_error(errors[idx]->first, "Could not list children: " + errors[idx]->second);
      }

      auto const blocked{ std::ranges::count_if(plan.nodes[idx].children, [&](std::size_t c) {
        return state[c] != node_state::DELETED;
      }) };
      if (blocked > 0) {
        throw partial_teardown_error(std::to_string(blocked) +
                                     " child(ren) could not be deleted");
      }

      auto live{ retry_call(options_.retry, "list children of " + ref.id, [&] {
        return client_.list_children(ref);
      }) };
      std::erase_if(live, [&](tracker_entity const &c) {
        return !is_teardown_child(c) || deleted_ids.contains(c.ref.id);
      });
      if (!live.empty()) {
        if (!final_check) {
          REHEARSE_TRACE_DELETION_DEFERRED(ref.id, static_cast<std::int64_t>(live.size()));
          return attempt{ .outcome = std::nullopt, .live_children = live.size() };
        }
        throw partial_teardown_error(ref.id + " still has " + std::to_string(live.size()) +
                                     " live child(ren)");
      }

      retry_call(options_.retry, "delete " + ref.id, [&] { client_.delete_entity(ref); });
      REHEARSE_TRACE_ENTITY_DELETED(ref.id, options_.dry_run);
      tui::info("Deleted %s", describe_ref(ref).c_str());
      return attempt{ .outcome = entity_outcome{ .identity = identity_of(idx),
                                                 .ref = ref,
                                                 .status = outcome_status::DELETED,
                                                 .error = std::nullopt,
                                                 .reason = {} } };
    } catch (std::exception const &ex) {
      return attempt{ .outcome = failed_outcome(identity_of(idx), ref, ex) };
    }
  } };

  for (std::size_t level{ 0 }; level < plan.levels.size(); ++level) {
    std::vector<std::size_t> indices;
    for (auto const idx : plan.levels[level]) {
      if (include_projects || plan.nodes[idx].entity.ref.type != entity_type::PROJECT) {
        indices.push_back(idx);
      }
    }
    if (indices.empty()) { continue; }

    level_trace_scope const trace_scope{ "teardown",
                                         static_cast<std::int64_t>(level),
                                         static_cast<std::int64_t>(indices.size()) };

    std::vector<attempt> results(indices.size());
    run_bounded(options_.max_concurrency, indices.size(), [&](std::size_t i) {
      results[i] = try_delete(indices[i], false);
    });

    std::vector<std::size_t> deferred;
    auto const settle{ [&](std::size_t idx, entity_outcome outcome) {
      if (outcome.status == outcome_status::DELETED) {
        state[idx] = node_state::DELETED;
        deleted_ids.insert(plan.nodes[idx].entity.ref.id);
      } else {
        state[idx] = node_state::LEFT;
      }
      report.add(std::move(outcome));
    } };

    for (std::size_t i{ 0 }; i < indices.size(); ++i) {
      if (results[i].outcome) {
        settle(indices[i], std::move(*results[i].outcome));
      } else {
        deferred.push_back(indices[i]);
      }
    }

    if (!deferred.empty()) {
      tui::debug("Rechecking %zu deferred deletion(s) at level %zu", deferred.size(), level);
      std::vector<attempt> rechecked(deferred.size());
      run_bounded(options_.max_concurrency, deferred.size(), [&](std::size_t i) {
        rechecked[i] = try_delete(deferred[i], true);
      });
      for (std::size_t i{ 0 }; i < deferred.size(); ++i) {
        settle(deferred[i], std::move(*rechecked[i].outcome));
      }
    }
  }

  // Kept nodes are never attempted, so their discovery failures surface here.
  for (std::size_t idx{ 0 }; idx < plan.nodes.size(); ++idx) {
    if (state[idx] != node_state::PENDING || !errors[idx]) { continue; }
    rehearse_error const ex{ errors[idx]->first,
                             "Could not list children: " + errors[idx]->second };
    report.add(failed_outcome(identity_of(idx), plan.nodes[idx].entity.ref, ex));
  }

  return report;
}

run_report orchestrator::rebuild(std::vector<logical_identity> const &projects,
                                 std::vector<entity_definition> entities,
                                 std::unordered_set<logical_identity> const &pre_existing) {
  // Validate the catalog before anything is deleted.
  auto const graph{ dependency_graph_build(std::move(entities), pre_existing) };

  auto report{ teardown(projects, false) };
  if (!report.ok()) {
    tui::warn("Teardown left %zu entities in place; continuing with setup",
              report.failed_count());
  }
  report.append(execute_setup(graph));
  return report;
}

}  // namespace rehearse
