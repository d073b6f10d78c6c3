#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace rehearse {

namespace trace_events {

struct level_start {
  std::string run;  // "setup" or "teardown"
  std::int64_t level;
  std::int64_t entity_count;
};

struct level_complete {
  std::string run;
  std::int64_t level;
  std::int64_t duration_ms;
};

struct entity_resolved {
  std::string entity;
  std::string ref;
  bool from_cache;
};

struct entity_created {
  std::string entity;
  std::string ref;
  bool dry_run;
};

struct entity_skipped {
  std::string entity;
  std::string ref;
};

struct entity_failed {
  std::string entity;
  std::string kind;
  std::string reason;
};

struct entity_deleted {
  std::string ref;
  bool dry_run;
};

struct deletion_deferred {
  std::string ref;
  std::int64_t live_children;
};

struct retry_scheduled {
  std::string operation;
  std::int64_t attempt;
  std::int64_t delay_ms;
  std::string reason;
};

struct http_request {
  std::string method;
  std::string url;
  std::int64_t status;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::level_start,
                                   trace_events::level_complete,
                                   trace_events::entity_resolved,
                                   trace_events::entity_created,
                                   trace_events::entity_skipped,
                                   trace_events::entity_failed,
                                   trace_events::entity_deleted,
                                   trace_events::deletion_deferred,
                                   trace_events::retry_scheduled,
                                   trace_events::http_request>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits level_start on construction and level_complete with the elapsed time
// on destruction.
struct level_trace_scope {
  std::string run;
  std::int64_t level;
  std::chrono::steady_clock::time_point start;

  level_trace_scope(std::string run_name, std::int64_t level_value, std::int64_t entity_count);
  ~level_trace_scope();
};

}  // namespace rehearse

#define REHEARSE_TRACE_UNLIKELY [[unlikely]]

#define REHEARSE_TRACE_EMIT(event_expr) \
  do { \
    if (::rehearse::tui::g_trace_enabled) REHEARSE_TRACE_UNLIKELY { \
        ::rehearse::tui::trace event_expr; \
      } \
  } while (0)

#define REHEARSE_TRACE_LEVEL_START(run_value, level_value, entity_count_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::level_start{ \
      .run = (run_value), \
      .level = (level_value), \
      .entity_count = (entity_count_value), \
  }))

#define REHEARSE_TRACE_LEVEL_COMPLETE(run_value, level_value, duration_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::level_complete{ \
      .run = (run_value), \
      .level = (level_value), \
      .duration_ms = (duration_value), \
  }))

#define REHEARSE_TRACE_ENTITY_RESOLVED(entity_value, ref_value, from_cache_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::entity_resolved{ \
      .entity = (entity_value), \
      .ref = (ref_value), \
      .from_cache = (from_cache_value), \
  }))

#define REHEARSE_TRACE_ENTITY_CREATED(entity_value, ref_value, dry_run_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::entity_created{ \
      .entity = (entity_value), \
      .ref = (ref_value), \
      .dry_run = (dry_run_value), \
  }))

#define REHEARSE_TRACE_ENTITY_SKIPPED(entity_value, ref_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::entity_skipped{ \
      .entity = (entity_value), \
      .ref = (ref_value), \
  }))

#define REHEARSE_TRACE_ENTITY_FAILED(entity_value, kind_value, reason_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::entity_failed{ \
      .entity = (entity_value), \
      .kind = (kind_value), \
      .reason = (reason_value), \
  }))

#define REHEARSE_TRACE_ENTITY_DELETED(ref_value, dry_run_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::entity_deleted{ \
      .ref = (ref_value), \
      .dry_run = (dry_run_value), \
  }))

#define REHEARSE_TRACE_DELETION_DEFERRED(ref_value, live_children_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::deletion_deferred{ \
      .ref = (ref_value), \
      .live_children = (live_children_value), \
  }))

#define REHEARSE_TRACE_RETRY_SCHEDULED(operation_value, \
                                       attempt_value, \
                                       delay_value, \
                                       reason_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::retry_scheduled{ \
      .operation = (operation_value), \
      .attempt = (attempt_value), \
      .delay_ms = (delay_value), \
      .reason = (reason_value), \
  }))

#define REHEARSE_TRACE_HTTP_REQUEST(method_value, url_value, status_value, duration_value) \
  REHEARSE_TRACE_EMIT((::rehearse::trace_events::http_request{ \
      .method = (method_value), \
      .url = (url_value), \
      .status = (status_value), \
      .duration_ms = (duration_value), \
  }))
