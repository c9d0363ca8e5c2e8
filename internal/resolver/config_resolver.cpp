#include "config_resolver.hpp"

#include <cctype>
#include <charconv>

#include "internal/model/cloud_recording_policy.hpp"

namespace snapshot::resolver {

namespace {

bool IsDigits(std::string_view value) {
  if (value.empty()) return false;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool IsIpv4(std::string_view host) {
  int octets = 0;
  while (!host.empty()) {
    auto dot   = host.find('.');
    auto octet = host.substr(0, dot);
    if (!IsDigits(octet) || octet.size() > 3) return false;

    int value = 0;
    std::from_chars(octet.data(), octet.data() + octet.size(), value);
    if (value > 255) return false;
    ++octets;

    if (dot == std::string_view::npos) break;
    host.remove_prefix(dot + 1);
    if (host.empty()) return false;
  }
  return octets == 4;
}

bool IsValidLabel(std::string_view label) {
  if (label.empty() || label.size() > 63) return false;
  if (label.front() == '-' || label.back() == '-') return false;
  for (char c : label) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
  }
  return true;
}

} // namespace

bool ConfigResolver::IsValidHost(std::string_view host) {
  if (host.empty() || host.size() > 253) return false;

  bool all_numeric = true;
  for (char c : host) {
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') {
      all_numeric = false;
      break;
    }
  }
  if (all_numeric) return IsIpv4(host);

  while (!host.empty()) {
    auto dot = host.find('.');
    if (!IsValidLabel(host.substr(0, dot))) return false;
    if (dot == std::string_view::npos) break;
    host.remove_prefix(dot + 1);
    if (host.empty()) return false;
  }
  return true;
}

std::optional<HostPort> ConfigResolver::ParseHost(std::string_view url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) return std::nullopt;

  auto authority = url.substr(scheme_end + 3);
  authority      = authority.substr(0, authority.find_first_of("/?#"));

  if (auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  HostPort result;
  auto     colon = authority.find(':');
  if (colon != std::string_view::npos) {
    auto port_text = authority.substr(colon + 1);
    if (!IsDigits(port_text) || port_text.size() > 5) return std::nullopt;

    std::uint32_t port = 0;
    std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (port == 0 || port > 65535) return std::nullopt;

    result.port = port;
    authority   = authority.substr(0, colon);
  }

  if (!IsValidHost(authority)) return std::nullopt;

  result.host = std::string(authority);
  return result;
}

ResolveResult ConfigResolver::Resolve(const model::Camera& camera, const events::EventHandlerPipeline& pipeline) {
  if (camera.exid.empty()) {
    return ResolveResult::Err(ConfigErrorCode::kMissingIdentity, "camera has no external id", std::to_string(camera.id));
  }

  auto url = camera.SnapshotUrl();
  if (!ParseHost(url)) {
    return ResolveResult::Err(ConfigErrorCode::kInvalidHost, "invalid camera host", url);
  }

  WorkerConfig config;
  config.identity = camera.exid;
  config.handlers = pipeline.Handlers();

  auto& settings         = config.settings;
  settings.camera_id     = camera.id;
  settings.camera_exid   = camera.exid;
  settings.vendor_exid   = camera.VendorExid();
  settings.schedule      = model::CloudRecordingPolicy::ScheduleFor(camera.cloud_recording);
  settings.timezone      = camera.timezone;
  settings.url           = std::move(url);
  settings.auth          = camera.Auth();
  settings.sleep         = model::CloudRecordingPolicy::SleepFor(camera.cloud_recording);
  settings.initial_sleep = model::CloudRecordingPolicy::InitialSleepFor(camera.cloud_recording, camera.exid);

  return ResolveResult::Ok(std::move(config));
}

} // namespace snapshot::resolver
