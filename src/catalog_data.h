#pragma once

// Raw rows behind catalog_builtin(). Not part of the public catalog API.

#include "entity.h"

#include <span>

namespace rehearse::catalog_data {

struct project_row {
  char const *key;
  char const *name;
  char const *description;
};

struct hierarchy_row {
  char const *project_key;
  entity_type type;
  char const *summary;
  char const *description;
};

struct constraint_row {
  char const *project_key;
  char const *summary;
  char const *description;
  char const *guild;
  char const *materiality;
  char const *mitigation;
  char const *status;
  entity_type target_type;
  char const *target_summary;
};

struct version_row {
  char const *name;
  char const *description;
  bool released;
};

std::span<project_row const> projects();
std::span<hierarchy_row const> hierarchy();
std::span<constraint_row const> constraints();
std::span<version_row const> versions();

}  // namespace rehearse::catalog_data
