#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace snapshot::model {

// Weekly recording windows: day name ("Monday") -> "HH:MM-HH:MM" ranges.
using Schedule = std::map<std::string, std::vector<std::string>>;

struct Vendor {
  std::string exid;
  std::string name;
};

struct CloudRecording {
  std::string status;               // "on", "off", "paused", "on-scheduled"
  int         frequency        = 1; // snapshots per minute
  int         storage_duration = 0; // days
  Schedule    schedule;
};

/*
  A network camera as stored in the catalog.

  Read-only input to the supervisor; the derived accessors below are the
  only place that knows how a snapshot URL and credentials are assembled.
*/
struct Camera {
  std::int64_t          id = 0;
  std::string           exid;
  std::string           name;
  std::optional<Vendor> vendor;
  std::string           model_snapshot_path;
  std::string           external_host;
  std::uint32_t         external_http_port = 0;
  std::string           username;
  std::string           password;
  std::string           timezone = "Etc/UTC";

  std::optional<CloudRecording> cloud_recording;

  // Empty when the camera has no external host.
  std::string SnapshotUrl() const;
  std::string Auth() const;
  std::string VendorExid() const;
};

} // namespace snapshot::model
