#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/camera_catalog.hpp"
#include "sqlite_db.hpp"

namespace snapshot::catalog::sqlite {

/*
  Camera catalog backed by a SQLite `cameras` table.

  One row per camera; the cloud recording columns are NULL for cameras
  without cloud recording. The schedule is stored as a JSON object of
  day name -> ["HH:MM-HH:MM", ...]. A row whose schedule cannot be parsed
  is logged and left out; sqlite failures throw util::CatalogUnavailable.
*/
class SqliteCatalog final : public CameraCatalog {
 public:
  explicit SqliteCatalog(std::shared_ptr<SqliteDB> db);

  // CREATE TABLE IF NOT EXISTS, for fresh databases and tests.
  void EnsureSchema();

  std::vector<model::Camera>   ListAll() override;
  std::optional<model::Camera> Get(const std::string& exid) override;

  void Upsert(const model::Camera& camera);

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace snapshot::catalog::sqlite
