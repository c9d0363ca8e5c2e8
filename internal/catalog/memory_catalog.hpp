#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "camera_catalog.hpp"

namespace snapshot::runtime::config {
class MemoryCatalogConfig;
}

namespace snapshot::catalog {

/*
  In-process catalog, seeded from the runtime config or by tests.
  Keeps insertion order.
*/
class MemoryCatalog final : public CameraCatalog {
 public:
  MemoryCatalog() = default;
  explicit MemoryCatalog(std::vector<model::Camera> cameras);

  static std::vector<model::Camera> CamerasFromConfig(const snapshot::runtime::config::MemoryCatalogConfig& config);

  std::vector<model::Camera>   ListAll() override;
  std::optional<model::Camera> Get(const std::string& exid) override;

  // Replaces the camera with the same exid, or appends it.
  void Upsert(const model::Camera& camera);
  bool Remove(const std::string& exid);

 private:
  std::mutex                 mutex_;
  std::vector<model::Camera> cameras_;
};

} // namespace snapshot::catalog
