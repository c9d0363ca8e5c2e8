#pragma once

#include <stdexcept>
#include <string>

namespace snapshot::util {

/*
  Central error types.

  Per-camera configuration problems are reported as values (see
  resolver::ConfigError). These exceptions cover collaborator and
  startup failures.
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bad startup configuration. Only fatal before the supervisor starts.
class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The camera catalog could not be read.
class CatalogUnavailable : public std::runtime_error {
 public:
  explicit CatalogUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by a capture source; ends the worker run and triggers a restart.
class CaptureFailed : public std::runtime_error {
 public:
  explicit CaptureFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace snapshot::util
