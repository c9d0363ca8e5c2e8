#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "internal/events/event_handler_pipeline.hpp"
#include "internal/model/camera.hpp"
#include "worker_config.hpp"

namespace snapshot::resolver {

enum class ConfigErrorCode {
  kInvalidHost,
  kMissingIdentity,
};

struct ConfigError {
  ConfigErrorCode code = ConfigErrorCode::kInvalidHost;
  std::string     message;
  // The offending input, e.g. the URL whose host could not be used.
  std::string value;
};

class ResolveResult {
 public:
  static ResolveResult Ok(WorkerConfig config) {
    return ResolveResult(std::move(config));
  }

  static ResolveResult Err(ConfigErrorCode code, std::string message, std::string value = {}) {
    return ResolveResult(ConfigError{code, std::move(message), std::move(value)});
  }

  explicit operator bool() const {
    return std::holds_alternative<WorkerConfig>(value_);
  }

  const WorkerConfig& Config() const {
    return std::get<WorkerConfig>(value_);
  }

  const ConfigError& Error() const {
    return std::get<ConfigError>(value_);
  }

 private:
  explicit ResolveResult(WorkerConfig config) : value_(std::move(config)) {
  }
  explicit ResolveResult(ConfigError error) : value_(std::move(error)) {
  }

  std::variant<WorkerConfig, ConfigError> value_;
};

struct HostPort {
  std::string                  host;
  std::optional<std::uint32_t> port;
};

/*
  Turns a camera record into a validated worker configuration.

  Pure and side-effect free: the same camera and pipeline always yield
  the same WorkerConfig. Bad input is reported through ResolveResult,
  never by throwing.
*/
class ConfigResolver {
 public:
  static ResolveResult Resolve(const model::Camera& camera, const events::EventHandlerPipeline& pipeline);

  // Authority part of an absolute URL, or nullopt if the host is unusable.
  static std::optional<HostPort> ParseHost(std::string_view url);

  static bool IsValidHost(std::string_view host);
};

} // namespace snapshot::resolver
