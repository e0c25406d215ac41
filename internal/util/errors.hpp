#pragma once

#include <stdexcept>
#include <string>

namespace pef::util {

/*
  Central error types.

  ConfigurationError aborts a run before any phase starts.
  SidecarParseError is local: the sidecar is recorded unmatched.
  StateError means a persisted state file could not be used.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SidecarParseError : public std::runtime_error {
 public:
  explicit SidecarParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StateError : public std::runtime_error {
 public:
  explicit StateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pef::util
