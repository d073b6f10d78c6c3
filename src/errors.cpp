#include "errors.h"

namespace rehearse {

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::CYCLE: return "cycle";
    case error_kind::DANGLING_PARENT: return "dangling_parent";
    case error_kind::UNRESOLVED_PARENT: return "unresolved_parent";
    case error_kind::TRANSPORT: return "transport";
    case error_kind::RATE_LIMIT: return "rate_limit";
    case error_kind::VALIDATION: return "validation";
    case error_kind::PARTIAL_TEARDOWN: return "partial_teardown";
    case error_kind::UNKNOWN: return "unknown";
  }
  return "unknown";
}

error_kind classify_error(std::exception const &ex) {
  if (auto const *err{ dynamic_cast<rehearse_error const *>(&ex) }) { return err->kind(); }
  return error_kind::UNKNOWN;
}

}  // namespace rehearse
