#include "memory_catalog.hpp"

#include <algorithm>
#include <utility>

#include "config/config.pb.h"

namespace snapshot::catalog {

namespace {

model::Camera FromSeed(const snapshot::runtime::config::CameraSeed& seed) {
  model::Camera camera;
  camera.id                  = seed.id();
  camera.exid                = seed.exid();
  camera.name                = seed.name();
  camera.model_snapshot_path = seed.model_snapshot_path();
  camera.external_host       = seed.external_host();
  camera.external_http_port  = seed.external_http_port();
  camera.username            = seed.username();
  camera.password            = seed.password();
  if (!seed.timezone().empty()) {
    camera.timezone = seed.timezone();
  }

  if (seed.has_vendor()) {
    camera.vendor = model::Vendor{seed.vendor().exid(), seed.vendor().name()};
  }

  if (seed.has_cloud_recording()) {
    const auto&           cr = seed.cloud_recording();
    model::CloudRecording recording;
    recording.status           = cr.status();
    recording.frequency        = cr.frequency();
    recording.storage_duration = cr.storage_duration();
    for (const auto& [day, ranges] : cr.schedule()) {
      recording.schedule[day] = {ranges.ranges().begin(), ranges.ranges().end()};
    }
    camera.cloud_recording = std::move(recording);
  }

  return camera;
}

} // namespace

MemoryCatalog::MemoryCatalog(std::vector<model::Camera> cameras) : cameras_(std::move(cameras)) {
}

std::vector<model::Camera> MemoryCatalog::CamerasFromConfig(const snapshot::runtime::config::MemoryCatalogConfig& config) {
  std::vector<model::Camera> cameras;
  cameras.reserve(config.cameras_size());
  for (const auto& seed : config.cameras()) {
    cameras.push_back(FromSeed(seed));
  }
  return cameras;
}

std::vector<model::Camera> MemoryCatalog::ListAll() {
  std::lock_guard lock(mutex_);
  return cameras_;
}

std::optional<model::Camera> MemoryCatalog::Get(const std::string& exid) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(cameras_.begin(), cameras_.end(), [&](const model::Camera& c) { return c.exid == exid; });
  if (it == cameras_.end()) return std::nullopt;
  return *it;
}

void MemoryCatalog::Upsert(const model::Camera& camera) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(cameras_.begin(), cameras_.end(), [&](const model::Camera& c) { return c.exid == camera.exid; });
  if (it == cameras_.end()) {
    cameras_.push_back(camera);
  } else {
    *it = camera;
  }
}

bool MemoryCatalog::Remove(const std::string& exid) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(cameras_.begin(), cameras_.end(), [&](const model::Camera& c) { return c.exid == exid; });
  if (it == cameras_.end()) return false;
  cameras_.erase(it);
  return true;
}

} // namespace snapshot::catalog
