#include "run_report.h"

#include <cstdio>
#include <sstream>

namespace rehearse {

std::string_view outcome_status_name(outcome_status status) {
  switch (status) {
    case outcome_status::CREATED: return "created";
    case outcome_status::SKIPPED_EXISTING: return "skipped-existing";
    case outcome_status::FAILED: return "failed";
    case outcome_status::DELETED: return "deleted";
  }
  return "unknown";
}

void run_report::add(entity_outcome outcome) { outcomes_.push_back(std::move(outcome)); }

void run_report::append(run_report const &other) {
  outcomes_.insert(outcomes_.end(), other.outcomes_.begin(), other.outcomes_.end());
}

type_counts run_report::counts(entity_type type) const {
  type_counts result;
  for (auto const &o : outcomes_) {
    if (o.identity.type != type) { continue; }
    switch (o.status) {
      case outcome_status::CREATED: ++result.created; break;
      case outcome_status::SKIPPED_EXISTING: ++result.skipped; break;
      case outcome_status::FAILED: ++result.failed; break;
      case outcome_status::DELETED: ++result.deleted; break;
    }
  }
  return result;
}

type_counts run_report::totals() const {
  type_counts result;
  for (std::size_t i{ 0 }; i < kEntityTypeCount; ++i) {
    auto const c{ counts(static_cast<entity_type>(i)) };
    result.created += c.created;
    result.skipped += c.skipped;
    result.failed += c.failed;
    result.deleted += c.deleted;
  }
  return result;
}

std::size_t run_report::failed_count() const {
  std::size_t n{ 0 };
  for (auto const &o : outcomes_) {
    if (o.status == outcome_status::FAILED) { ++n; }
  }
  return n;
}

std::string run_report::render_summary(bool dry_run) const {
  std::ostringstream oss;
  if (dry_run) { oss << "DRY RUN: no changes were made\n"; }

  char line[128]{};
  std::snprintf(line,
                sizeof line,
                "%-20s %8s %8s %8s %8s\n",
                "type",
                "created",
                "skipped",
                "failed",
                "deleted");
  oss << line;

  for (std::size_t i{ 0 }; i < kEntityTypeCount; ++i) {
    auto const type{ static_cast<entity_type>(i) };
    auto const c{ counts(type) };
    if (c.created + c.skipped + c.failed + c.deleted == 0) { continue; }
    std::snprintf(line,
                  sizeof line,
                  "%-20s %8zu %8zu %8zu %8zu\n",
                  std::string{ entity_type_name(type) }.c_str(),
                  c.created,
                  c.skipped,
                  c.failed,
                  c.deleted);
    oss << line;
  }

  auto const t{ totals() };
  std::snprintf(line,
                sizeof line,
                "%-20s %8zu %8zu %8zu %8zu\n",
                "total",
                t.created,
                t.skipped,
                t.failed,
                t.deleted);
  oss << line;

  for (auto const &o : outcomes_) {
    if (o.status != outcome_status::FAILED) { continue; }
    oss << "FAILED " << o.identity.canonical() << " ["
        << error_kind_name(o.error.value_or(error_kind::UNKNOWN)) << "] " << o.reason
        << '\n';
  }

  return oss.str();
}

}  // namespace rehearse
