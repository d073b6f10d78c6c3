#include "retry.h"

#include <algorithm>

namespace rehearse {

std::chrono::milliseconds retry_backoff_delay(
    retry_policy const &policy,
    int failed_attempt,
    std::optional<std::chrono::milliseconds> retry_after) {
  auto delay{ policy.base_delay };
  for (int i{ 1 }; i < failed_attempt && delay < policy.max_delay; ++i) { delay *= 2; }
  delay = std::min(delay, policy.max_delay);

  if (retry_after && *retry_after > delay) { delay = *retry_after; }
  return delay;
}

}  // namespace rehearse
