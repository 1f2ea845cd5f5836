#pragma once

#include <stdexcept>
#include <string>

namespace jobmeter::util {

/*
  Central error types.

  These get translated later to jobmeter.errors.v1.ErrorCode
  (see internal/core/error_status.hpp).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Forbidden : public std::runtime_error {
 public:
  explicit Forbidden(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Job exists but its files were purged by retention.
class Gone : public std::runtime_error {
 public:
  explicit Gone(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Admission errors. Raised before any job row exists.

class QuotaExceeded : public std::runtime_error {
 public:
  explicit QuotaExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationFailed : public std::runtime_error {
 public:
  explicit ValidationFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Provider errors. Retried locally up to the stage attempt cap.

class ProviderError : public std::runtime_error {
 public:
  explicit ProviderError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace jobmeter::util
