#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/camera.hpp"

namespace snapshot::catalog {

/*
  Read access to the camera catalog owned by another service.

  Implementations throw util::CatalogUnavailable when the backing store
  cannot be read.
*/
class CameraCatalog {
 public:
  virtual ~CameraCatalog() = default;

  virtual std::vector<model::Camera>   ListAll()                       = 0;
  virtual std::optional<model::Camera> Get(const std::string& exid) = 0;
};

} // namespace snapshot::catalog
