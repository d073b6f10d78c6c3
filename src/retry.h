#pragma once

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace rehearse {

struct retry_policy {
  int max_attempts{ 4 };
  std::chrono::milliseconds base_delay{ 500 };
  std::chrono::milliseconds max_delay{ 8000 };
  std::function<void(std::chrono::milliseconds)> sleep{
    [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }
  };
};

// Delay before attempt (failed_attempt + 1): base * 2^(failed_attempt - 1), capped,
// raised to the server's Retry-After when that is larger.
std::chrono::milliseconds retry_backoff_delay(
    retry_policy const &policy,
    int failed_attempt,
    std::optional<std::chrono::milliseconds> retry_after = std::nullopt);

// Run fn, retrying transport and rate-limit errors per policy. Any other
// exception, or the last transient one, propagates.
template <typename Fn>
auto retry_call(retry_policy const &policy, std::string const &what, Fn &&fn)
    -> decltype(fn()) {
  for (int attempt{ 1 };; ++attempt) {
    try {
      return fn();
    } catch (transport_error const &ex) {
      if (attempt >= policy.max_attempts) { throw; }

      std::optional<std::chrono::milliseconds> retry_after;
      if (auto const *rl{ dynamic_cast<rate_limit_error const *>(&ex) }) {
        retry_after = rl->retry_after();
      }
      auto const delay{ retry_backoff_delay(policy, attempt, retry_after) };

      tui::warn("%s failed (attempt %d/%d): %s; retrying in %lld ms",
                what.c_str(),
                attempt,
                policy.max_attempts,
                ex.what(),
                static_cast<long long>(delay.count()));
      REHEARSE_TRACE_RETRY_SCHEDULED(what,
                                     static_cast<std::int64_t>(attempt),
                                     static_cast<std::int64_t>(delay.count()),
                                     std::string{ ex.what() });
      if (policy.sleep) { policy.sleep(delay); }
    }
  }
}

}  // namespace rehearse
