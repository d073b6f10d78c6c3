#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rehearse {

enum class error_kind {
  CYCLE,              // Parent chain revisits a node (pre-flight, fatal)
  DANGLING_PARENT,    // Parent reference not in catalog and not pre-existing (fatal)
  UNRESOLVED_PARENT,  // Parent failed or could not be found (entity skipped)
  TRANSPORT,          // Network or server failure (retried)
  RATE_LIMIT,         // Tracker throttled the request (retried)
  VALIDATION,         // Tracker rejected the entity (not retried)
  PARTIAL_TEARDOWN,   // Node left in place because a child could not be deleted
  UNKNOWN
};

std::string_view error_kind_name(error_kind kind);

struct rehearse_error : std::runtime_error {
  rehearse_error(error_kind kind, std::string const &message)
      : std::runtime_error{ message }, kind_{ kind } {}

  error_kind kind() const { return kind_; }

 private:
  error_kind kind_;
};

struct cycle_error : rehearse_error {
  explicit cycle_error(std::string const &message)
      : rehearse_error{ error_kind::CYCLE, message } {}
};

struct dangling_parent_error : rehearse_error {
  explicit dangling_parent_error(std::string const &message)
      : rehearse_error{ error_kind::DANGLING_PARENT, message } {}
};

struct unresolved_parent_error : rehearse_error {
  explicit unresolved_parent_error(std::string const &message)
      : rehearse_error{ error_kind::UNRESOLVED_PARENT, message } {}
};

struct transport_error : rehearse_error {
  explicit transport_error(std::string const &message)
      : rehearse_error{ error_kind::TRANSPORT, message } {}

 protected:
  transport_error(error_kind kind, std::string const &message)
      : rehearse_error{ kind, message } {}
};

struct rate_limit_error : transport_error {
  explicit rate_limit_error(std::string const &message,
                            std::optional<std::chrono::milliseconds> retry_after = {})
      : transport_error{ error_kind::RATE_LIMIT, message }, retry_after_{ retry_after } {}

  std::optional<std::chrono::milliseconds> retry_after() const { return retry_after_; }

 private:
  std::optional<std::chrono::milliseconds> retry_after_;
};

struct validation_error : rehearse_error {
  explicit validation_error(std::string const &message)
      : rehearse_error{ error_kind::VALIDATION, message } {}
};

struct partial_teardown_error : rehearse_error {
  explicit partial_teardown_error(std::string const &message)
      : rehearse_error{ error_kind::PARTIAL_TEARDOWN, message } {}
};

// Kind of a caught exception; anything outside the taxonomy is UNKNOWN.
error_kind classify_error(std::exception const &ex);

}  // namespace rehearse
