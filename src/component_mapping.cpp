#include "component_mapping.h"

#include "catalog.h"
#include "errors.h"
#include "tui.h"

#include <libpq-fe.h>

#include <map>
#include <memory>
#include <set>
#include <utility>

namespace rehearse {

namespace {

constexpr char kApplicationsQuery[]{
  "SELECT component_id, identifier, component_name "
  "FROM source_data.component_mapping "
  "WHERE mapping_type = 'it_business_application' "
  "ORDER BY component_id"
};

using pg_conn_ptr = std::unique_ptr<PGconn, decltype(&PQfinish)>;
using pg_result_ptr = std::unique_ptr<PGresult, decltype(&PQclear)>;

std::string column(PGresult *res, int row, int col) {
  if (PQgetisnull(res, row, col)) { return {}; }
  return PQgetvalue(res, row, col);
}

}  // namespace

pg_component_source::pg_component_source(db_settings settings)
    : settings_{ std::move(settings) } {}

std::vector<application_row> pg_component_source::fetch_applications() {
  char const *const keys[]{ "host", "port", "dbname", "user", "password", nullptr };
  char const *const values[]{ settings_.host.c_str(),
                              settings_.port.c_str(),
                              settings_.name.c_str(),
                              settings_.user.c_str(),
                              settings_.password.c_str(),
                              nullptr };

  pg_conn_ptr conn{ PQconnectdbParams(keys, values, 0), &PQfinish };
  if (!conn) { throw transport_error("PQconnectdbParams failed: out of memory"); }
  if (PQstatus(conn.get()) != CONNECTION_OK) {
    throw transport_error("Database connection to " + settings_.host + ":" + settings_.port +
                          "/" + settings_.name + " failed: " + PQerrorMessage(conn.get()));
  }

  tui::debug("Querying component mappings from %s/%s",
             settings_.host.c_str(),
             settings_.name.c_str());

  pg_result_ptr res{ PQexec(conn.get(), kApplicationsQuery), &PQclear };
  if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
    throw transport_error(std::string{ "Component mapping query failed: " } +
                          PQerrorMessage(conn.get()));
  }

  std::vector<application_row> apps;
  int const rows{ PQntuples(res.get()) };
  apps.reserve(static_cast<std::size_t>(rows));
  for (int i{ 0 }; i < rows; ++i) {
    apps.push_back({ .component_id = column(res.get(), i, 0),
                     .identifier = column(res.get(), i, 1),
                     .component_name = column(res.get(), i, 2) });
  }

  tui::info("Found %d applications", rows);
  return apps;
}

std::vector<entity_definition> component_mappings_assign(
    std::vector<application_row> const &apps,
    std::vector<entity_definition> const &catalog) {
  std::vector<std::string> project_keys;
  std::map<std::string, std::vector<std::string>> features;
  for (auto const &def : catalog) {
    if (def.type == entity_type::PROJECT) { project_keys.push_back(def.project_key); }
    if (def.type == entity_type::FEATURE) { features[def.project_key].push_back(def.name); }
  }
  if (project_keys.empty()) { return {}; }

  std::map<std::string, std::size_t> per_project;
  std::set<std::pair<std::string, std::string>> seen;
  std::vector<entity_definition> out;

  for (std::size_t i{ 0 }; i < apps.size(); ++i) {
    auto const &app{ apps[i] };
    auto const &key{ project_keys[i % project_keys.size()] };
    auto const &project_features{ features[key] };
    if (project_features.empty()) {
      tui::warn("Project %s has no features; skipping application %s",
                key.c_str(),
                app.component_name.c_str());
      continue;
    }
    if (app.component_name.empty() || !seen.insert({ key, app.component_name }).second) {
      tui::warn("Skipping duplicate or unnamed application %s (%s) in %s",
                app.component_name.c_str(),
                app.component_id.c_str(),
                key.c_str());
      continue;
    }

    auto const &feature{ project_features[per_project[key]++ % project_features.size()] };
    out.push_back({ .type = entity_type::COMPONENT_MAPPING,
                    .name = app.component_name,
                    .project_key = key,
                    .parent = parent_ref{ entity_type::FEATURE, feature },
                    .attributes = { { "component_id", app.component_id },
                                    { "identifier", app.identifier },
                                    { "description",
                                      app.component_name + " (" + app.identifier + ")" } } });
  }
  return out;
}

}  // namespace rehearse
