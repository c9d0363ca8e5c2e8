#include "camera.hpp"

namespace snapshot::model {

std::string Camera::SnapshotUrl() const {
  if (external_host.empty()) {
    return {};
  }

  std::string url = "http://" + external_host;
  if (external_http_port != 0) {
    url += ":" + std::to_string(external_http_port);
  }
  if (!model_snapshot_path.empty() && model_snapshot_path.front() != '/') {
    url += '/';
  }
  url += model_snapshot_path;
  return url;
}

std::string Camera::Auth() const {
  if (username.empty() && password.empty()) {
    return {};
  }
  return username + ":" + password;
}

std::string Camera::VendorExid() const {
  return vendor ? vendor->exid : std::string{};
}

} // namespace snapshot::model
