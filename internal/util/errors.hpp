#pragma once

#include <stdexcept>
#include <string>

namespace market::util {

/*
  Central error types.

  Query-side errors get translated to gRPC status codes.
  The sync scheduler converts everything except StorageFatal into a
  reschedule decision.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Remote data client failure (network, timeout, rejected call).
class RemoteFailure : public std::runtime_error {
 public:
  explicit RemoteFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persisted settings disagree with the configuration. Never retried.
class ConfigMismatch : public std::runtime_error {
 public:
  explicit ConfigMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// I/O error or corruption in the store; terminates the affected task run.
class StorageFatal : public std::runtime_error {
 public:
  explicit StorageFatal(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace market::util
