#pragma once

#include "entity.h"
#include "util.h"

#include <string>
#include <vector>

namespace rehearse {

// One IT business application from the component mapping table.
struct application_row {
  std::string component_id;
  std::string identifier;
  std::string component_name;
};

class component_source : unmovable {
 public:
  virtual ~component_source() = default;

  // Applications ordered by component_id. Throws transport_error when the
  // source is unreachable.
  virtual std::vector<application_row> fetch_applications() = 0;
};

struct db_settings {
  std::string host{ "localhost" };
  std::string port{ "5432" };
  std::string name{ "lct_data" };
  std::string user{ "postgres" };
  std::string password{ "postgres" };
};

// Read-only PostgreSQL source; one connection and one query per fetch.
class pg_component_source : public component_source {
 public:
  explicit pg_component_source(db_settings settings);

  std::vector<application_row> fetch_applications() override;

 private:
  db_settings settings_;
};

// Assign applications round-robin to the catalog projects and, within each
// project, round-robin to its features. Produces one COMPONENT_MAPPING entity
// per application, parented to its feature. Applications whose name repeats
// within a project are dropped.
std::vector<entity_definition> component_mappings_assign(
    std::vector<application_row> const &apps,
    std::vector<entity_definition> const &catalog);

}  // namespace rehearse
