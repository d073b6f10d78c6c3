#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace rehearse {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

level_trace_scope::level_trace_scope(std::string run_name,
                                     std::int64_t level_value,
                                     std::int64_t entity_count)
    : run{ std::move(run_name) }, level{ level_value }, start{ std::chrono::steady_clock::now() } {
  REHEARSE_TRACE_LEVEL_START(run, level, entity_count);
}

level_trace_scope::~level_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  REHEARSE_TRACE_LEVEL_COMPLETE(run, level, static_cast<std::int64_t>(duration_ms));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(level_start),
                        TRACE_NAME(level_complete),
                        TRACE_NAME(entity_resolved),
                        TRACE_NAME(entity_created),
                        TRACE_NAME(entity_skipped),
                        TRACE_NAME(entity_failed),
                        TRACE_NAME(entity_deleted),
                        TRACE_NAME(deletion_deferred),
                        TRACE_NAME(retry_scheduled),
                        TRACE_NAME(http_request),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::level_start const &value) {
            std::ostringstream oss;
            oss << "level_start run=" << value.run << " level=" << value.level
                << " entities=" << value.entity_count;
            return oss.str();
          },
          [](trace_events::level_complete const &value) {
            std::ostringstream oss;
            oss << "level_complete run=" << value.run << " level=" << value.level
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::entity_resolved const &value) {
            std::ostringstream oss;
            oss << "entity_resolved entity=" << value.entity << " ref=" << value.ref
                << " from_cache=" << bool_string(value.from_cache);
            return oss.str();
          },
          [](trace_events::entity_created const &value) {
            std::ostringstream oss;
            oss << "entity_created entity=" << value.entity << " ref=" << value.ref
                << " dry_run=" << bool_string(value.dry_run);
            return oss.str();
          },
          [](trace_events::entity_skipped const &value) {
            std::ostringstream oss;
            oss << "entity_skipped entity=" << value.entity << " ref=" << value.ref;
            return oss.str();
          },
          [](trace_events::entity_failed const &value) {
            std::ostringstream oss;
            oss << "entity_failed entity=" << value.entity << " kind=" << value.kind
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::entity_deleted const &value) {
            std::ostringstream oss;
            oss << "entity_deleted ref=" << value.ref
                << " dry_run=" << bool_string(value.dry_run);
            return oss.str();
          },
          [](trace_events::deletion_deferred const &value) {
            std::ostringstream oss;
            oss << "deletion_deferred ref=" << value.ref
                << " live_children=" << value.live_children;
            return oss.str();
          },
          [](trace_events::retry_scheduled const &value) {
            std::ostringstream oss;
            oss << "retry_scheduled operation=" << value.operation
                << " attempt=" << value.attempt << " delay_ms=" << value.delay_ms
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::http_request const &value) {
            std::ostringstream oss;
            oss << "http_request method=" << value.method << " url=" << value.url
                << " status=" << value.status << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(match{
                 [&](trace_events::level_start const &value) {
                   append_kv(output, "run", value.run);
                   append_kv(output, "level", value.level);
                   append_kv(output, "entity_count", value.entity_count);
                 },
                 [&](trace_events::level_complete const &value) {
                   append_kv(output, "run", value.run);
                   append_kv(output, "level", value.level);
                   append_kv(output, "duration_ms", value.duration_ms);
                 },
                 [&](trace_events::entity_resolved const &value) {
                   append_kv(output, "entity", value.entity);
                   append_kv(output, "ref", value.ref);
                   append_kv(output, "from_cache", value.from_cache);
                 },
                 [&](trace_events::entity_created const &value) {
                   append_kv(output, "entity", value.entity);
                   append_kv(output, "ref", value.ref);
                   append_kv(output, "dry_run", value.dry_run);
                 },
                 [&](trace_events::entity_skipped const &value) {
                   append_kv(output, "entity", value.entity);
                   append_kv(output, "ref", value.ref);
                 },
                 [&](trace_events::entity_failed const &value) {
                   append_kv(output, "entity", value.entity);
                   append_kv(output, "kind", value.kind);
                   append_kv(output, "reason", value.reason);
                 },
                 [&](trace_events::entity_deleted const &value) {
                   append_kv(output, "ref", value.ref);
                   append_kv(output, "dry_run", value.dry_run);
                 },
                 [&](trace_events::deletion_deferred const &value) {
                   append_kv(output, "ref", value.ref);
                   append_kv(output, "live_children", value.live_children);
                 },
                 [&](trace_events::retry_scheduled const &value) {
                   append_kv(output, "operation", value.operation);
                   append_kv(output, "attempt", value.attempt);
                   append_kv(output, "delay_ms", value.delay_ms);
                   append_kv(output, "reason", value.reason);
                 },
                 [&](trace_events::http_request const &value) {
                   append_kv(output, "method", value.method);
                   append_kv(output, "url", value.url);
                   append_kv(output, "status", value.status);
                   append_kv(output, "duration_ms", value.duration_ms);
                 },
             },
             event);

  output.push_back('}');
  return output;
}

}  // namespace rehearse
